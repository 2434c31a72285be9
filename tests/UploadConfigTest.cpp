// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#define BOOST_TEST_MODULE UploadConfigTest

#include <boost/test/unit_test.hpp>
#include "ProgException.h"
#include "UploadConfig.h"

#define MIB		UPLOADCONFIG_MIB
#define GIB		UPLOADCONFIG_GIB


static UploadConfig makeValidConfig()
{
	UploadConfig config;
	config.sessionDir = "/tmp/sessions";

	return config;
}

BOOST_AUTO_TEST_CASE(DefaultPolicy)
{
	SizePolicy policy = SizePolicy::getDefault();

	BOOST_CHECK_EQUAL(policy.multipartThreshold, 64 * MIB);
	BOOST_REQUIRE_EQUAL(policy.tiers.size(), 3);

	BOOST_CHECK_EQUAL(policy.findTier(64 * MIB).chunkSize, 8 * MIB);
	BOOST_CHECK_EQUAL(policy.findTier(64 * MIB).concurrency, 10);
	BOOST_CHECK_EQUAL(policy.findTier(2 * GIB).chunkSize, 32 * MIB);
	BOOST_CHECK_EQUAL(policy.findTier(2 * GIB).concurrency, 5);
	BOOST_CHECK_EQUAL(policy.findTier(100 * GIB).chunkSize, 64 * MIB);
	BOOST_CHECK_EQUAL(policy.findTier(100 * GIB).concurrency, 2);

	BOOST_CHECK_NO_THROW(makeValidConfig().checkConfig() );
}

BOOST_AUTO_TEST_CASE(ParseTierList)
{
	SizeTierVec tiers;

	SizePolicy::parseTierList("512M:8M:4, 4G:16MiB:8 ,max:128M:2", tiers);

	BOOST_REQUIRE_EQUAL(tiers.size(), 3);
	BOOST_CHECK_EQUAL(tiers[0].upperBound, 512 * MIB);
	BOOST_CHECK_EQUAL(tiers[0].chunkSize, 8 * MIB);
	BOOST_CHECK_EQUAL(tiers[0].concurrency, 4);
	BOOST_CHECK_EQUAL(tiers[1].upperBound, 4 * GIB);
	BOOST_CHECK_EQUAL(tiers[1].chunkSize, 16 * MIB);
	BOOST_CHECK_EQUAL(tiers[2].upperBound, 0);
	BOOST_CHECK_EQUAL(tiers[2].chunkSize, 128 * MIB);

	UploadConfig config = makeValidConfig();
	config.sizePolicy.tiers = tiers;

	BOOST_CHECK_NO_THROW(config.checkConfig() );
	BOOST_CHECK_EQUAL(config.sizePolicy.tiersToString(),
		std::to_string(512 * MIB) + ":" + std::to_string(8 * MIB) + ":4," +
		std::to_string(4 * GIB) + ":" + std::to_string(16 * MIB) + ":8," +
		"max:" + std::to_string(128 * MIB) + ":2");
}

BOOST_AUTO_TEST_CASE(ParseInvalidTierList)
{
	SizeTierVec tiers;

	BOOST_CHECK_THROW(SizePolicy::parseTierList("", tiers), ProgException);
	BOOST_CHECK_THROW(SizePolicy::parseTierList("1G:8M", tiers), ProgException);
	BOOST_CHECK_THROW(SizePolicy::parseTierList("1G:8M:x", tiers), ProgException);
	BOOST_CHECK_THROW(SizePolicy::parseTierList("0:8M:2", tiers), ProgException);
	BOOST_CHECK_THROW(SizePolicy::parseTierList("1Q:8M:2", tiers), ProgException);
}

BOOST_AUTO_TEST_CASE(InvalidTierOrder)
{
	UploadConfig config = makeValidConfig();

	config.sizePolicy.tiers = { {2 * GIB, 8 * MIB, 4}, {1 * GIB, 16 * MIB, 4}, {0, 64 * MIB, 2} };
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config.sizePolicy.tiers = { {1 * GIB, 8 * MIB, 4} }; // last tier not unbounded
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config.sizePolicy.tiers = { {0, 8 * MIB, 4}, {0, 16 * MIB, 4} };
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config.sizePolicy.tiers = { {0, 8 * MIB, 0} };
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config.sizePolicy.tiers.clear();
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);
}

BOOST_AUTO_TEST_CASE(InvalidValues)
{
	UploadConfig config = makeValidConfig();
	config.sessionDir.clear();
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config = makeValidConfig();
	config.maxPartSize = config.minPartSize - 1;
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config = makeValidConfig();
	config.maxPartAttempts = 0;
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config = makeValidConfig();
	config.sseAlgorithm = "aws:kms";
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config = makeValidConfig();
	config.accessKey = "AKIAEXAMPLE";
	BOOST_CHECK_THROW(config.checkConfig(), ProgException);

	config.secretKey = "secret";
	BOOST_CHECK_NO_THROW(config.checkConfig() );
}

BOOST_AUTO_TEST_CASE(BucketRoles)
{
	UploadConfig config = makeValidConfig();

	BOOST_CHECK_THROW(config.getBucketName(BucketRole_MODELS), ProgException);

	config.setBucketName(BucketRole_MODELS, "models-bucket");
	config.setBucketName(BucketRole_TEMP, "temp-bucket");

	BOOST_CHECK_EQUAL(config.getBucketName(BucketRole_MODELS), "models-bucket");
	BOOST_CHECK_EQUAL(config.getBucketName(BucketRole_TEMP), "temp-bucket");
	BOOST_CHECK_THROW(config.getBucketName(BucketRole_OUTPUTS), ProgException);
	BOOST_CHECK_THROW(config.getBucketName(BucketRole_NUMROLES), ProgException);
}

BOOST_AUTO_TEST_CASE(RetryDelayAndConcurrency)
{
	UploadConfig config = makeValidConfig();
	config.retryBaseMS = 500;

	BOOST_CHECK_EQUAL(config.getRetryDelayMS(0), 0);
	BOOST_CHECK_EQUAL(config.getRetryDelayMS(1), 500);
	BOOST_CHECK_EQUAL(config.getRetryDelayMS(2), 1000);
	BOOST_CHECK_EQUAL(config.getRetryDelayMS(4), 4000);

	BOOST_CHECK_EQUAL(config.clampConcurrency(0), UPLOADCONFIG_MIN_CONCURRENCY);
	BOOST_CHECK_EQUAL(config.clampConcurrency(7), 7);
	BOOST_CHECK_EQUAL(config.clampConcurrency(1000), UPLOADCONFIG_MAX_CONCURRENCY);
}
