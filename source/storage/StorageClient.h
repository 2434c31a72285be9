// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef STORAGE_STORAGECLIENT_H_
#define STORAGE_STORAGECLIENT_H_

#include <ctime>
#include <string>
#include <vector>
#include "Common.h"
#include "storage/StorageException.h"


/**
 * Attributes that get attached to a new object on creation.
 */
struct ObjectAttribs
{
	std::string contentType; // empty to let the backend decide
	StringMap metadata; // user metadata key/value pairs
};

/**
 * Describes an object after successful single-shot or multipart upload.
 */
struct ObjectDescriptor
{
	std::string bucketName;
	std::string objectKey;
	std::string eTag;
	std::string url; // plain endpoint URL, not presigned
	uint64_t size{0};
};

/**
 * Result of a head-object request.
 */
struct ObjectInfo
{
	uint64_t size{0};
	std::string eTag;
	std::string contentType;
	time_t lastModified{0}; // seconds since the epoch
	StringMap metadata;
};

/**
 * A part as reported by the backend for an in-progress multipart upload.
 */
struct RemotePart
{
	unsigned partNumber{0};
	uint64_t size{0};
	std::string eTag;
};

/**
 * An in-progress multipart upload as reported by the backend.
 */
struct RemoteUpload
{
	std::string objectKey;
	std::string uploadID;
	time_t initiated{0}; // seconds since the epoch
};

/**
 * Part number and backend ETag, as required for multipart upload completion.
 */
struct PartETag
{
	unsigned partNumber{0};
	std::string eTag;
};

typedef std::vector<RemotePart> RemotePartVec;
typedef std::vector<RemoteUpload> RemoteUploadVec;
typedef std::vector<PartETag> PartETagVec;


/**
 * Capability interface over an S3-compatible backend. Implementations only talk to the network and
 * keep no upload state of their own, so a single instance can be shared by all worker threads.
 *
 * All methods throw a StorageException subclass on error; StorageTransientException is the only
 * class that is worth a retry.
 */
class StorageClient
{
	public:
		virtual ~StorageClient() {}

		/**
		 * @return backend-issued multipart upload ID.
		 */
		virtual std::string initiateMultipart(const std::string& bucketName,
			const std::string& objectKey, const ObjectAttribs& attribs) = 0;

		/**
		 * @partNumber 1-based part number.
		 * @return backend ETag for this part.
		 */
		virtual std::string uploadPart(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID, unsigned partNumber, const char* buf,
			size_t bufLen) = 0;

		/**
		 * @orderedParts all parts of the upload in ascending part number order.
		 */
		virtual ObjectDescriptor completeMultipart(const std::string& bucketName,
			const std::string& objectKey, const std::string& uploadID,
			const PartETagVec& orderedParts) = 0;

		/**
		 * Idempotent: aborting an unknown or already aborted upload is not an error.
		 */
		virtual void abortMultipart(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID) = 0;

		virtual void listParts(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID, RemotePartVec& outParts) = 0;

		virtual void listInProgressUploads(const std::string& bucketName,
			const std::string& keyPrefix, RemoteUploadVec& outUploads) = 0;

		/**
		 * Single-shot upload of a complete local file.
		 */
		virtual ObjectDescriptor putObject(const std::string& bucketName,
			const std::string& objectKey, const std::string& localPath, uint64_t fileSize,
			const ObjectAttribs& attribs) = 0;

		/**
		 * @return false if the object does not exist.
		 */
		virtual bool headObject(const std::string& bucketName, const std::string& objectKey,
			ObjectInfo& outInfo) = 0;

		virtual std::string presignURL(const std::string& bucketName,
			const std::string& objectKey, unsigned ttlSecs) = 0;
};

#endif /* STORAGE_STORAGECLIENT_H_ */
