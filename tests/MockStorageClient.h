// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TESTS_MOCKSTORAGECLIENT_H_
#define TESTS_MOCKSTORAGECLIENT_H_

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include "storage/StorageClient.h"
#include "toolkits/FileTk.h"
#include "toolkits/StringTk.h"


/**
 * In-memory backend for tests. Keeps multipart uploads and completed objects in maps, counts calls
 * per operation, tracks the maximum number of concurrently running part uploads and lets tests
 * inject errors for individual parts.
 */
class MockStorageClient : public StorageClient
{
	public:
		/**
		 * @storeData false to only keep part sizes and ETags, e.g. for huge sparse test files.
		 */
		explicit MockStorageClient(bool storeData = true) : storeData(storeData) {}

		/**
		 * Error to throw for a part. numFailures counts down with each failed call; 0 means the
		 * error is thrown on every call.
		 */
		enum FaultType
		{
			Fault_TRANSIENT = 0,
			Fault_AUTH,
			Fault_QUOTA,
		};

		struct Fault
		{
			FaultType type{Fault_TRANSIENT};
			unsigned numFailures{0};
		};

		struct MockUpload
		{
			std::string bucketName;
			std::string objectKey;
			ObjectAttribs attribs;
			std::map<unsigned, std::string> partData; // empty strings if !storeData
			std::map<unsigned, RemotePart> parts;
			time_t initiated{0};
		};

		struct MockObject
		{
			std::string data;
			ObjectInfo info;
		};

		std::string initiateMultipart(const std::string& bucketName,
			const std::string& objectKey, const ObjectAttribs& attribs) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numInitiateCalls++;

			const std::string uploadID = "upload-" + std::to_string(++lastUploadNum);

			MockUpload& upload = uploads[uploadID];
			upload.bucketName = bucketName;
			upload.objectKey = objectKey;
			upload.attribs = attribs;
			upload.initiated = time(NULL) + lastUploadNum; // strictly increasing

			return uploadID;
		}

		std::string uploadPart(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID, unsigned partNumber, const char* buf,
			size_t bufLen) override
		{
			{
				std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

				numUploadPartCalls++;
				numPartCallsPerPart[partNumber]++;
				numInFlightParts++;
				maxInFlightParts = std::max(maxInFlightParts, numInFlightParts);
			}

			if(partDelayMS)
				std::this_thread::sleep_for(std::chrono::milliseconds(partDelayMS) );

			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numInFlightParts--;

			throwInjectedFaultUnlocked(partNumber);

			std::map<std::string, MockUpload>::iterator iter = uploads.find(uploadID);

			if(iter == uploads.end() )
				throw StorageNotFoundException("No such upload. UploadID: " + uploadID);

			const std::string eTag = "\"etag-" + std::to_string(partNumber) + "-" +
				std::to_string(bufLen) + "\"";

			RemotePart remotePart;
			remotePart.partNumber = partNumber;
			remotePart.size = bufLen;
			remotePart.eTag = eTag;

			iter->second.parts[partNumber] = remotePart;
			iter->second.partData[partNumber] = storeData ? std::string(buf, bufLen) : "";

			return eTag;
		}

		ObjectDescriptor completeMultipart(const std::string& bucketName,
			const std::string& objectKey, const std::string& uploadID,
			const PartETagVec& orderedParts) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numCompleteCalls++;
			lastCompletedParts = orderedParts;

			if(numCompleteFailures)
			{
				numCompleteFailures--;
				throw StorageTransientException("Injected completion failure.");
			}

			std::map<std::string, MockUpload>::iterator iter = uploads.find(uploadID);

			if(iter == uploads.end() )
				throw StorageNotFoundException("No such upload. UploadID: " + uploadID);

			MockObject object;
			unsigned expectedPartNumber = 1;

			for(const PartETag& partETag : orderedParts)
			{
				if(partETag.partNumber != expectedPartNumber++)
					throw StorageException("Invalid part order.");

				const RemotePart& remotePart = iter->second.parts.at(partETag.partNumber);

				if(remotePart.eTag != partETag.eTag)
					throw StorageException("Invalid part ETag.");

				object.data += iter->second.partData[partETag.partNumber];
				object.info.size += remotePart.size;
			}

			object.info.eTag = "\"multipart-" + std::to_string(orderedParts.size() ) + "\"";
			object.info.contentType = iter->second.attribs.contentType;
			object.info.metadata = iter->second.attribs.metadata;
			object.info.lastModified = time(NULL);

			objects[bucketName + "/" + objectKey] = object;
			uploads.erase(iter);

			return makeDescriptor(bucketName, objectKey, object.info);
		}

		void abortMultipart(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numAbortCalls++;

			uploads.erase(uploadID);
		}

		void listParts(const std::string& bucketName, const std::string& objectKey,
			const std::string& uploadID, RemotePartVec& outParts) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numListPartsCalls++;

			std::map<std::string, MockUpload>::iterator iter = uploads.find(uploadID);

			if(iter == uploads.end() )
				throw StorageNotFoundException("No such upload. UploadID: " + uploadID);

			for(const auto& partPair : iter->second.parts)
				outParts.push_back(partPair.second);
		}

		void listInProgressUploads(const std::string& bucketName,
			const std::string& keyPrefix, RemoteUploadVec& outUploads) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			for(const auto& uploadPair : uploads)
			{
				if( (uploadPair.second.bucketName != bucketName) ||
					(uploadPair.second.objectKey.compare(0, keyPrefix.length(), keyPrefix) != 0) )
					continue;

				RemoteUpload remoteUpload;
				remoteUpload.objectKey = uploadPair.second.objectKey;
				remoteUpload.uploadID = uploadPair.first;
				remoteUpload.initiated = uploadPair.second.initiated;

				outUploads.push_back(remoteUpload);
			}
		}

		ObjectDescriptor putObject(const std::string& bucketName,
			const std::string& objectKey, const std::string& localPath, uint64_t fileSize,
			const ObjectAttribs& attribs) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numPutObjectCalls++;

			throwInjectedFaultUnlocked(0);

			MockObject object;

			FileTk::readFile(localPath, object.data);

			if(object.data.size() != fileSize)
				throw ProgException("Source file size changed. Path: " + localPath);

			object.info.size = fileSize;
			object.info.eTag = "\"single-" + std::to_string(fileSize) + "\"";
			object.info.contentType = attribs.contentType;
			object.info.metadata = attribs.metadata;
			object.info.lastModified = time(NULL);

			objects[bucketName + "/" + objectKey] = object;

			return makeDescriptor(bucketName, objectKey, object.info);
		}

		bool headObject(const std::string& bucketName, const std::string& objectKey,
			ObjectInfo& outInfo) override
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			std::map<std::string, MockObject>::iterator iter =
				objects.find(bucketName + "/" + objectKey);

			if(iter == objects.end() )
				return false;

			outInfo = iter->second.info;
			return true;
		}

		std::string presignURL(const std::string& bucketName, const std::string& objectKey,
			unsigned ttlSecs) override
		{
			return StringTk::makeObjectURL(MOCKSTORAGE_ENDPOINT, bucketName, objectKey) +
				"?X-Amz-Expires=" + std::to_string(ttlSecs);
		}

		/**
		 * Inject an error for the given part number (0 for single-shot puts).
		 */
		void injectFault(unsigned partNumber, FaultType type, unsigned numFailures)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			Fault fault;
			fault.type = type;
			fault.numFailures = numFailures;

			faults[partNumber] = fault;
		}

		void clearFaults()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			faults.clear();
		}

		/**
		 * Drop a part of an in-progress upload, as if the backend lost it.
		 */
		void forgetPart(const std::string& uploadID, unsigned partNumber)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			uploads.at(uploadID).parts.erase(partNumber);
			uploads.at(uploadID).partData.erase(partNumber);
		}

		/**
		 * Change the size of a part as reported by listParts.
		 */
		void setRemotePartSize(const std::string& uploadID, unsigned partNumber, uint64_t size)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			uploads.at(uploadID).parts.at(partNumber).size = size;
		}

		bool hasObject(const std::string& bucketName, const std::string& objectKey)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return objects.count(bucketName + "/" + objectKey) != 0;
		}

		std::string getObjectData(const std::string& bucketName, const std::string& objectKey)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return objects.at(bucketName + "/" + objectKey).data;
		}

		size_t getNumInProgressUploads()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return uploads.size();
		}

		unsigned getNumPartCalls(unsigned partNumber)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return numPartCallsPerPart[partNumber];
		}

		std::mutex mutex; // protects all members

		std::map<std::string, MockUpload> uploads; // key is uploadID
		std::map<std::string, MockObject> objects; // key is "bucket/key"
		std::map<unsigned, Fault> faults; // key is part number
		std::map<unsigned, unsigned> numPartCallsPerPart;
		PartETagVec lastCompletedParts;

		unsigned numInitiateCalls{0};
		unsigned numUploadPartCalls{0};
		unsigned numCompleteCalls{0};
		unsigned numAbortCalls{0};
		unsigned numListPartsCalls{0};
		unsigned numPutObjectCalls{0};
		unsigned numCompleteFailures{0}; // transient failures before completion succeeds
		unsigned numInFlightParts{0};
		unsigned maxInFlightParts{0};
		unsigned partDelayMS{0}; // to let concurrent part uploads overlap

	private:
		const bool storeData;
		unsigned lastUploadNum{0};

		static constexpr const char* MOCKSTORAGE_ENDPOINT = "https://mock.example.com";

		void throwInjectedFaultUnlocked(unsigned partNumber)
		{
			std::map<unsigned, Fault>::iterator iter = faults.find(partNumber);

			if(iter == faults.end() )
				return;

			const FaultType faultType = iter->second.type;

			if(iter->second.numFailures)
			{
				if(!--iter->second.numFailures)
					faults.erase(iter);
			}

			switch(faultType)
			{
				case Fault_AUTH:
					throw StorageAuthException("Injected auth failure. "
						"Part: " + std::to_string(partNumber) );
				case Fault_QUOTA:
					throw StorageQuotaException("Injected quota failure. "
						"Part: " + std::to_string(partNumber) );
				default:
					throw StorageTransientException("Injected transient failure. "
						"Part: " + std::to_string(partNumber) );
			}
		}

		ObjectDescriptor makeDescriptor(const std::string& bucketName,
			const std::string& objectKey, const ObjectInfo& info) const
		{
			ObjectDescriptor descriptor;
			descriptor.bucketName = bucketName;
			descriptor.objectKey = objectKey;
			descriptor.eTag = info.eTag;
			descriptor.url = StringTk::makeObjectURL(MOCKSTORAGE_ENDPOINT, bucketName, objectKey);
			descriptor.size = info.size;

			return descriptor;
		}
};

#endif /* TESTS_MOCKSTORAGECLIENT_H_ */
