// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef UPLOADCONFIG_H_
#define UPLOADCONFIG_H_

#include <array>
#include <string>
#include <vector>
#include "Common.h"

#define UPLOADCONFIG_MIB					(1024ULL * 1024)
#define UPLOADCONFIG_GIB					(1024ULL * 1024 * 1024)

#define UPLOADCONFIG_MULTIPART_THRESHOLD	(64 * UPLOADCONFIG_MIB)
#define UPLOADCONFIG_MIN_PARTSIZE			(5 * UPLOADCONFIG_MIB)
#define UPLOADCONFIG_MAX_PARTSIZE			(5 * UPLOADCONFIG_GIB)
#define UPLOADCONFIG_MAX_NUMPARTS			10000
#define UPLOADCONFIG_MIN_CONCURRENCY		1
#define UPLOADCONFIG_MAX_CONCURRENCY		50
#define UPLOADCONFIG_MAX_PARTATTEMPTS		5
#define UPLOADCONFIG_RETRYBASE_MS			500
#define UPLOADCONFIG_COMPLETION_RETRIES		3
#define UPLOADCONFIG_CALLTIMEOUT_MS			(300 * 1000)
#define UPLOADCONFIG_CONNECTTIMEOUT_MS		(5 * 1000)
#define UPLOADCONFIG_PROGRESSINTERVAL_MS	1000
#define UPLOADCONFIG_RETENTION_SECS			(7 * 24 * 60 * 60)
#define UPLOADCONFIG_PRESIGN_TTL_SECS		3600

#define UPLOADCONFIG_SSE_NONE				""
#define UPLOADCONFIG_SSE_AES256				"AES256"

#define UPLOADCONFIG_TIER_UNBOUNDED_STR		"max"


/**
 * One row of the size policy table: files up to (excluding) upperBound are uploaded with the given
 * chunk size and number of concurrent workers.
 */
struct SizeTier
{
	uint64_t upperBound{0}; // 0 means unbounded, only valid for the last tier
	uint64_t chunkSize{0};
	unsigned concurrency{1};
};

typedef std::vector<SizeTier> SizeTierVec;


/**
 * Size-tiered policy that decides between single-shot and multipart upload and picks chunk size
 * and concurrency.
 */
struct SizePolicy
{
	uint64_t multipartThreshold{UPLOADCONFIG_MULTIPART_THRESHOLD}; // smaller files: single-shot
	SizeTierVec tiers; // ordered by upperBound, last one unbounded

	static SizePolicy getDefault();
	static void parseTierList(const std::string& tierListStr, SizeTierVec& outTiers);

	const SizeTier& findTier(uint64_t totalSize) const;
	std::string tiersToString() const;
};


/**
 * Injected configuration of the upload core. The core never reads the environment, so everything
 * that influences its behavior is in here.
 */
class UploadConfig
{
	public:
		UploadConfig();

		// backend connection
		std::string endpointURL; // e.g. "https://s3.wasabisys.com"
		std::string region;
		std::string accessKey; // empty to use the default credentials provider chain
		std::string secretKey;
		unsigned callTimeoutMS{UPLOADCONFIG_CALLTIMEOUT_MS}; // per backend call, e.g. one part
		unsigned connectTimeoutMS{UPLOADCONFIG_CONNECTTIMEOUT_MS};
		unsigned sdkLogLevel{0}; // 0 disables the AWS SDK log system
		std::string sdkLogfilePrefix;

		// bucket role resolution, indexed by BucketRole
		std::array<std::string, BucketRole_NUMROLES> bucketNames;

		// part planning
		SizePolicy sizePolicy;
		uint64_t minPartSize{UPLOADCONFIG_MIN_PARTSIZE}; // backend limit for non-final parts
		uint64_t maxPartSize{UPLOADCONFIG_MAX_PARTSIZE};
		unsigned maxNumParts{UPLOADCONFIG_MAX_NUMPARTS};

		// retry policy
		unsigned maxPartAttempts{UPLOADCONFIG_MAX_PARTATTEMPTS}; // including the first attempt
		unsigned retryBaseMS{UPLOADCONFIG_RETRYBASE_MS}; // doubled for each further attempt
		unsigned numCompletionRetries{UPLOADCONFIG_COMPLETION_RETRIES};

		// progress reporting
		unsigned progressIntervalMS{UPLOADCONFIG_PROGRESSINTERVAL_MS};

		// session store
		std::string sessionDir;
		uint64_t sessionRetentionSecs{UPLOADCONFIG_RETENTION_SECS};

		// new object attributes
		std::string sseAlgorithm{UPLOADCONFIG_SSE_NONE};
		bool usePublicReadACL{false};

		void checkConfig() const;
		const std::string& getBucketName(BucketRole bucketRole) const;
		void setBucketName(BucketRole bucketRole, const std::string& bucketName);
		unsigned clampConcurrency(unsigned concurrency) const;
		uint64_t getRetryDelayMS(unsigned numAttemptsDone) const;
};


#endif /* UPLOADCONFIG_H_ */
