// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <cerrno>
#include <cstring>
#include "Logger.h"
#include "storage/S3StorageClient.h"

#ifdef S3_SUPPORT
	#include <aws/core/http/HttpTypes.h>
	#include <aws/core/utils/memory/stl/AWSStringStream.h>
	#include <aws/s3/model/AbortMultipartUploadRequest.h>
	#include <aws/s3/model/CompletedMultipartUpload.h>
	#include <aws/s3/model/CompletedPart.h>
	#include <aws/s3/model/CompleteMultipartUploadRequest.h>
	#include <aws/s3/model/CreateMultipartUploadRequest.h>
	#include <aws/s3/model/HeadObjectRequest.h>
	#include <aws/s3/model/ListMultipartUploadsRequest.h>
	#include <aws/s3/model/ListPartsRequest.h>
	#include <aws/s3/model/PutObjectRequest.h>
	#include <aws/s3/model/UploadPartRequest.h>
#endif // S3_SUPPORT

#define S3STORAGECLIENT_ALLOCATION_TAG		"S3StorageClient"
#define S3STORAGECLIENT_MAX_LIST_PARTS		1000 // max parts per list request (S3 limit)


/**
 * @throw ProgException if this was built without S3 support or the client can't be initialized.
 */
S3StorageClient::S3StorageClient(const UploadConfig& config) :
	endpointURL(config.endpointURL), sseAlgorithm(config.sseAlgorithm),
	usePublicReadACL(config.usePublicReadACL)
{
#ifndef S3_SUPPORT
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
#else
	s3Client = S3Tk::initS3Client(config);
#endif // S3_SUPPORT
}

#ifndef S3_SUPPORT

/* without S3 support, the constructor throws, so none of the methods below can ever be called on
	an existing object */

std::string S3StorageClient::initiateMultipart(const std::string& bucketName,
	const std::string& objectKey, const ObjectAttribs& attribs)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

std::string S3StorageClient::uploadPart(const std::string& bucketName,
	const std::string& objectKey, const std::string& uploadID, unsigned partNumber,
	const char* buf, size_t bufLen)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

ObjectDescriptor S3StorageClient::completeMultipart(const std::string& bucketName,
	const std::string& objectKey, const std::string& uploadID, const PartETagVec& orderedParts)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

void S3StorageClient::abortMultipart(const std::string& bucketName, const std::string& objectKey,
	const std::string& uploadID)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

void S3StorageClient::listParts(const std::string& bucketName, const std::string& objectKey,
	const std::string& uploadID, RemotePartVec& outParts)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

void S3StorageClient::listInProgressUploads(const std::string& bucketName,
	const std::string& keyPrefix, RemoteUploadVec& outUploads)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

ObjectDescriptor S3StorageClient::putObject(const std::string& bucketName,
	const std::string& objectKey, const std::string& localPath, uint64_t fileSize,
	const ObjectAttribs& attribs)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

bool S3StorageClient::headObject(const std::string& bucketName, const std::string& objectKey,
	ObjectInfo& outInfo)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

std::string S3StorageClient::presignURL(const std::string& bucketName,
	const std::string& objectKey, unsigned ttlSecs)
{
	throw ProgException(std::string(__func__) + " called, but this was built without S3 support");
}

#else // S3_SUPPORT

/**
 * Set content type, user metadata, server-side encryption and ACL of a new object. Works for
 * PutObjectRequest and CreateMultipartUploadRequest.
 */
template <typename REQUESTTYPE>
void S3StorageClient::applyObjectAttribs(REQUESTTYPE& request, const ObjectAttribs& attribs) const
{
	if(!attribs.contentType.empty() )
		request.SetContentType(attribs.contentType);

	for(const auto& metadataPair : attribs.metadata)
		request.AddMetadata(metadataPair.first, metadataPair.second);

	if(!sseAlgorithm.empty() )
		request.SetServerSideEncryption(
			S3::ServerSideEncryptionMapper::GetServerSideEncryptionForName(sseAlgorithm) );

	if(usePublicReadACL)
		request.SetACL(S3::ObjectCannedACL::public_read);
}

std::string S3StorageClient::initiateMultipart(const std::string& bucketName,
	const std::string& objectKey, const ObjectAttribs& attribs)
{
	S3::CreateMultipartUploadRequest request;
	request.SetBucket(bucketName);
	request.SetKey(objectKey);

	applyObjectAttribs(request, attribs);

	S3::CreateMultipartUploadOutcome outcome = s3Client->CreateMultipartUpload(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
		S3Tk::throwStorageException(std::string("Multipart upload creation failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; ", outcome.GetError() );

	return outcome.GetResult().GetUploadId().c_str();
}

std::string S3StorageClient::uploadPart(const std::string& bucketName,
	const std::string& objectKey, const std::string& uploadID, unsigned partNumber,
	const char* buf, size_t bufLen)
{
	/* note: stream needs to have the exact part length. otherwise the AWS SDK will send the full
		streamBuf len despite smaller contentLength */
	std::shared_ptr<Aws::IOStream> s3MemStream = std::make_shared<S3MemoryStream>(
		(unsigned char*)buf, bufLen);

	S3::UploadPartRequest request;
	request.WithBucket(bucketName)
		.WithKey(objectKey)
		.WithUploadId(uploadID)
		.WithPartNumber(partNumber)
		.WithContentLength(bufLen);
	request.SetBody(s3MemStream);

	S3::UploadPartOutcome outcome = s3Client->UploadPart(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
		S3Tk::throwStorageException(std::string("Multipart part upload failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; "
			"Part: " + std::to_string(partNumber) + "; ", outcome.GetError() );

	return outcome.GetResult().GetETag().c_str();
}

ObjectDescriptor S3StorageClient::completeMultipart(const std::string& bucketName,
	const std::string& objectKey, const std::string& uploadID, const PartETagVec& orderedParts)
{
	S3::CompletedMultipartUpload completedMultipartUpload;

	for(const PartETag& partETag : orderedParts)
	{
		S3::CompletedPart completedPart;
		completedPart.SetPartNumber(partETag.partNumber);
		completedPart.SetETag(partETag.eTag);

		completedMultipartUpload.AddParts(completedPart);
	}

	S3::CompleteMultipartUploadRequest request;
	request.WithBucket(bucketName)
		.WithKey(objectKey)
		.WithUploadId(uploadID)
		.WithMultipartUpload(completedMultipartUpload);

	S3::CompleteMultipartUploadOutcome outcome = s3Client->CompleteMultipartUpload(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
		S3Tk::throwStorageException(std::string("Multipart upload completion failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; "
			"NumParts: " + std::to_string(orderedParts.size() ) + "; ", outcome.GetError() );

	ObjectDescriptor object;
	object.bucketName = bucketName;
	object.objectKey = objectKey;
	object.eTag = outcome.GetResult().GetETag().c_str();
	object.url = outcome.GetResult().GetLocation().c_str();

	return object;
}

void S3StorageClient::abortMultipart(const std::string& bucketName, const std::string& objectKey,
	const std::string& uploadID)
{
	S3::AbortMultipartUploadRequest request;
	request.SetBucket(bucketName);
	request.SetKey(objectKey);
	request.SetUploadId(uploadID);

	S3::AbortMultipartUploadOutcome outcome = s3Client->AbortMultipartUpload(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
	{
		if(outcome.GetError().GetErrorType() == S3Errors::NO_SUCH_UPLOAD)
		{
			LOGGER(Log_DEBUG, "Multipart upload to abort does not exist. "
				"UploadID: " << uploadID << std::endl);
			return;
		}

		S3Tk::throwStorageException(std::string("Multipart upload abort failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; "
			"UploadID: " + uploadID + "; ", outcome.GetError() );
	}
}

void S3StorageClient::listParts(const std::string& bucketName, const std::string& objectKey,
	const std::string& uploadID, RemotePartVec& outParts)
{
	int partNumberMarker = 0;
	bool isTruncated; // true if S3 server reports more parts left to retrieve

	do
	{
		S3::ListPartsRequest request;
		request.SetBucket(bucketName);
		request.SetKey(objectKey);
		request.SetUploadId(uploadID);
		request.SetMaxParts(S3STORAGECLIENT_MAX_LIST_PARTS);

		if(partNumberMarker)
			request.SetPartNumberMarker(partNumberMarker);

		S3::ListPartsOutcome outcome = s3Client->ListParts(request);

		IF_UNLIKELY(!outcome.IsSuccess() )
			S3Tk::throwStorageException(std::string("Multipart upload parts listing failed. ") +
				"Endpoint: " + endpointURL + "; "
				"Bucket: " + bucketName + "; "
				"Object: " + objectKey + "; "
				"UploadID: " + uploadID + "; ", outcome.GetError() );

		for(const S3::Part& part : outcome.GetResult().GetParts() )
		{
			RemotePart remotePart;
			remotePart.partNumber = part.GetPartNumber();
			remotePart.size = part.GetSize();
			remotePart.eTag = part.GetETag().c_str();

			outParts.push_back(remotePart);
		}

		isTruncated = outcome.GetResult().GetIsTruncated();
		partNumberMarker = outcome.GetResult().GetNextPartNumberMarker();

	} while(isTruncated);
}

void S3StorageClient::listInProgressUploads(const std::string& bucketName,
	const std::string& keyPrefix, RemoteUploadVec& outUploads)
{
	std::string nextKeyMarker;
	std::string nextUploadIDMarker;
	bool isTruncated; // true if S3 server reports more uploads left to retrieve

	do
	{
		S3::ListMultipartUploadsRequest request;
		request.SetBucket(bucketName);
		request.SetPrefix(keyPrefix);

		if(!nextKeyMarker.empty() )
			request.SetKeyMarker(nextKeyMarker);

		if(!nextUploadIDMarker.empty() )
			request.SetUploadIdMarker(nextUploadIDMarker);

		S3::ListMultipartUploadsOutcome outcome = s3Client->ListMultipartUploads(request);

		IF_UNLIKELY(!outcome.IsSuccess() )
			S3Tk::throwStorageException(std::string("Multipart uploads listing failed. ") +
				"Endpoint: " + endpointURL + "; "
				"Bucket: " + bucketName + "; "
				"Prefix: " + keyPrefix + "; ", outcome.GetError() );

		for(const S3::MultipartUpload& upload : outcome.GetResult().GetUploads() )
		{
			RemoteUpload remoteUpload;
			remoteUpload.objectKey = upload.GetKey().c_str();
			remoteUpload.uploadID = upload.GetUploadId().c_str();
			remoteUpload.initiated = upload.GetInitiated().Seconds();

			outUploads.push_back(remoteUpload);
		}

		isTruncated = outcome.GetResult().GetIsTruncated();
		nextKeyMarker = outcome.GetResult().GetNextKeyMarker().c_str();
		nextUploadIDMarker = outcome.GetResult().GetNextUploadIdMarker().c_str();

	} while(isTruncated);
}

/**
 * @throw ProgException if the local file can't be opened; StorageException on backend error.
 */
ObjectDescriptor S3StorageClient::putObject(const std::string& bucketName,
	const std::string& objectKey, const std::string& localPath, uint64_t fileSize,
	const ObjectAttribs& attribs)
{
	std::shared_ptr<Aws::IOStream> fileStream = Aws::MakeShared<Aws::FStream>(
		S3STORAGECLIENT_ALLOCATION_TAG, localPath.c_str(),
		std::ios_base::in | std::ios_base::binary);

	if(!fileStream->good() )
		throw ProgException("Unable to open file for reading. "
			"Path: " + localPath + "; "
			"SysErr: " + strerror(errno) );

	S3::PutObjectRequest request;
	request.WithBucket(bucketName)
		.WithKey(objectKey)
		.WithContentLength(fileSize);

	if(fileSize)
		request.SetBody(fileStream);

	applyObjectAttribs(request, attribs);

	S3::PutObjectOutcome outcome = s3Client->PutObject(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
		S3Tk::throwStorageException(std::string("Object upload failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; ", outcome.GetError() );

	ObjectDescriptor object;
	object.bucketName = bucketName;
	object.objectKey = objectKey;
	object.eTag = outcome.GetResult().GetETag().c_str();
	object.size = fileSize;

	return object;
}

bool S3StorageClient::headObject(const std::string& bucketName, const std::string& objectKey,
	ObjectInfo& outInfo)
{
	S3::HeadObjectRequest request;
	request.SetBucket(bucketName);
	request.SetKey(objectKey);

	S3::HeadObjectOutcome outcome = s3Client->HeadObject(request);

	IF_UNLIKELY(!outcome.IsSuccess() )
	{
		if(outcome.GetError().GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND)
			return false;

		S3Tk::throwStorageException(std::string("Object metadata retrieval failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey + "; ", outcome.GetError() );
	}

	const S3::HeadObjectResult& result = outcome.GetResult();

	outInfo.size = result.GetContentLength();
	outInfo.eTag = result.GetETag().c_str();
	outInfo.contentType = result.GetContentType().c_str();
	outInfo.lastModified = result.GetLastModified().Seconds();

	for(const auto& metadataPair : result.GetMetadata() )
		outInfo.metadata[metadataPair.first.c_str()] = metadataPair.second.c_str();

	return true;
}

std::string S3StorageClient::presignURL(const std::string& bucketName,
	const std::string& objectKey, unsigned ttlSecs)
{
	Aws::String url = s3Client->GeneratePresignedUrl(bucketName, objectKey,
		Aws::Http::HttpMethod::HTTP_GET, ttlSecs);

	if(url.empty() )
		throw StorageException(std::string("Presigned URL generation failed. ") +
			"Endpoint: " + endpointURL + "; "
			"Bucket: " + bucketName + "; "
			"Object: " + objectKey);

	return url.c_str();
}

#endif // S3_SUPPORT
