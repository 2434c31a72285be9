// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef UPLOADSESSION_H_
#define UPLOADSESSION_H_

#include <algorithm>
#include <boost/property_tree/ptree.hpp>
#include <ctime>
#include <string>
#include <vector>
#include "Common.h"
#include "storage/StorageClient.h"

namespace bpt = boost::property_tree;


/**
 * Session status. Order of values matters: transitions only go to a higher value and never leave a
 * terminal state.
 */
enum SessionStatus
{
	SessionStatus_PENDING = 0,
	SessionStatus_INPROGRESS,
	SessionStatus_COMPLETED, // terminal
	SessionStatus_ABORTED, // terminal
	SessionStatus_FAILED, // terminal
};

enum PartStatus
{
	PartStatus_PENDING = 0,
	PartStatus_UPLOADING, // claimed by exactly one worker
	PartStatus_UPLOADED, // terminal, etag immutable
	PartStatus_FAILED,
};


/**
 * A contiguous byte range of the source file that gets uploaded as one multipart upload part.
 */
struct PartRecord
{
	unsigned partNumber{0}; // 1-based
	uint64_t offset{0};
	uint64_t length{0};
	std::string eTag; // set only once the backend acknowledged the part
	PartStatus status{PartStatus_PENDING};
	unsigned attemptCount{0};
};

typedef std::vector<PartRecord> PartRecordVec;


/**
 * Derived progress values. Never persisted, always recomputed from the part records.
 */
struct ProgressSnapshot
{
	uint64_t numBytesDone{0};
	uint64_t numBytesTotal{0};
	unsigned numPartsDone{0};
	unsigned numPartsTotal{0};
	unsigned numPartsUploading{0};
	double percent{0};
};


/**
 * Local record of one upload: identity, plan and per-part state. The record survives process
 * restart through SessionStore.
 */
class UploadSession
{
	public:
		std::string sessionID; // derived from bucket and key, see makeSessionID()
		std::string localPath;
		BucketRole bucketRole{BucketRole_OUTPUTS};
		std::string bucketName;
		std::string objectKey;
		uint64_t totalSize{0};
		uint64_t chunkSize{0}; // 0 for single-shot uploads
		unsigned concurrency{1};
		std::string uploadID; // backend multipart upload ID; empty for single-shot uploads
		SessionStatus status{SessionStatus_PENDING};
		ObjectAttribs attribs; // content type and metadata of the new object
		PartRecordVec parts; // ordered by part number, covering [0, totalSize)
		std::string objectETag; // ETag of the final object; set on completion
		std::string failureType; // error type name that failed the session; empty if not failed
		time_t createdAt{0};
		time_t updatedAt{0};

		static std::string makeSessionID(const std::string& bucketName,
			const std::string& objectKey);
		static bool isValidTransition(SessionStatus oldStatus, SessionStatus newStatus);

		void setStatus(SessionStatus newStatus);
		void computeProgress(ProgressSnapshot& outSnapshot) const;
		void getOrderedPartETags(PartETagVec& outPartETags) const;
		void checkPartsCoverage() const;

		void getAsPropertyTree(bpt::ptree& outTree) const;
		void setFromPropertyTree(const bpt::ptree& tree);

	// inliners
	public:
		bool isTerminal() const
		{
			return (status == SessionStatus_COMPLETED) || (status == SessionStatus_ABORTED) ||
				(status == SessionStatus_FAILED);
		}

		bool isMultipart() const
		{
			return !parts.empty();
		}

		uint64_t getMaxPartLength() const
		{
			uint64_t maxPartLength = 0;

			for(const PartRecord& part : parts)
				maxPartLength = std::max(maxPartLength, part.length);

			return maxPartLength;
		}

		/**
		 * @partNumber 1-based part number.
		 * @return NULL if partNumber is out of range.
		 */
		PartRecord* getPart(unsigned partNumber)
		{
			if(!partNumber || (partNumber > parts.size() ) )
				return NULL;

			return &parts[partNumber - 1];
		}

		void touch()
		{
			updatedAt = time(NULL);
		}
};

typedef std::vector<UploadSession> UploadSessionVec;


#endif /* UPLOADSESSION_H_ */
