// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef STORAGE_S3STORAGECLIENT_H_
#define STORAGE_S3STORAGECLIENT_H_

#include "storage/StorageClient.h"
#include "toolkits/S3Tk.h"
#include "UploadConfig.h"


/**
 * StorageClient implementation for S3-compatible services based on the AWS SDK CPP.
 *
 * S3Tk::initS3Global() must have been called before construction.
 */
class S3StorageClient : public StorageClient
{
	public:
		explicit S3StorageClient(const UploadConfig& config);
		virtual ~S3StorageClient() {}

		virtual std::string initiateMultipart(const std::string& bucketName,
			const std::string& objectKey, const ObjectAttribs& attribs) override;
		virtual std::string uploadPart(const std::string& bucketName,
			const std::string& objectKey, const std::string& uploadID, unsigned partNumber,
			const char* buf, size_t bufLen) override;
		virtual ObjectDescriptor completeMultipart(const std::string& bucketName,
			const std::string& objectKey, const std::string& uploadID,
			const PartETagVec& orderedParts) override;
		virtual void abortMultipart(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID) override;
		virtual void listParts(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID, RemotePartVec& outParts) override;
		virtual void listInProgressUploads(const std::string& bucketName,
			const std::string& keyPrefix, RemoteUploadVec& outUploads) override;
		virtual ObjectDescriptor putObject(const std::string& bucketName,
			const std::string& objectKey, const std::string& localPath, uint64_t fileSize,
			const ObjectAttribs& attribs) override;
		virtual bool headObject(const std::string& bucketName, const std::string& objectKey,
			ObjectInfo& outInfo) override;
		virtual std::string presignURL(const std::string& bucketName,
			const std::string& objectKey, unsigned ttlSecs) override;

	private:
		std::string endpointURL;
		std::string sseAlgorithm; // UPLOADCONFIG_SSE_NONE to disable server-side encryption
		bool usePublicReadACL;

#ifdef S3_SUPPORT
		std::shared_ptr<S3Client> s3Client; // thread-safe, shared by all workers

		template <typename REQUESTTYPE>
		void applyObjectAttribs(REQUESTTYPE& request, const ObjectAttribs& attribs) const;
#endif // S3_SUPPORT
};

#endif /* STORAGE_S3STORAGECLIENT_H_ */
