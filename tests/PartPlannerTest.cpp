// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#define BOOST_TEST_MODULE PartPlannerTest

#include <boost/test/unit_test.hpp>
#include "PartPlanner.h"
#include "UploadException.h"

#define MIB		UPLOADCONFIG_MIB
#define GIB		UPLOADCONFIG_GIB


/**
 * Check that parts are numbered 1..N, contiguous and cover exactly totalSize.
 */
static void checkContiguous(const PartPlan& plan, uint64_t totalSize)
{
	uint64_t nextOffset = 0;

	for(size_t i=0; i < plan.parts.size(); i++)
	{
		BOOST_CHECK_EQUAL(plan.parts[i].partNumber, i + 1);
		BOOST_CHECK_EQUAL(plan.parts[i].offset, nextOffset);
		BOOST_CHECK(plan.parts[i].length > 0);
		BOOST_CHECK(plan.parts[i].length <= plan.chunkSize);
		BOOST_CHECK_EQUAL(plan.parts[i].status, PartStatus_PENDING);

		nextOffset += plan.parts[i].length;
	}

	BOOST_CHECK_EQUAL(nextOffset, totalSize);
}

BOOST_AUTO_TEST_CASE(SmallFileIsSingleShot)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	planner.plan(10 * MIB, 0, 0, plan);

	BOOST_CHECK(plan.parts.empty() );
	BOOST_CHECK_EQUAL(plan.chunkSize, 0);

	planner.plan(64 * MIB - 1, 0, 0, plan);
	BOOST_CHECK(plan.parts.empty() );

	planner.plan(0, 0, 0, plan);
	BOOST_CHECK(plan.parts.empty() );
}

BOOST_AUTO_TEST_CASE(ThresholdIsMultipart)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	planner.plan(64 * MIB, 0, 0, plan);

	BOOST_CHECK_EQUAL(plan.chunkSize, 8 * MIB);
	BOOST_CHECK_EQUAL(plan.concurrency, 10);
	BOOST_CHECK_EQUAL(plan.parts.size(), 8);
	checkContiguous(plan, 64 * MIB);
}

BOOST_AUTO_TEST_CASE(DefaultTiers)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	planner.plan(500 * MIB, 0, 0, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 8 * MIB);
	BOOST_CHECK_EQUAL(plan.concurrency, 10);
	BOOST_CHECK_EQUAL(plan.parts.size(), 63);
	BOOST_CHECK_EQUAL(plan.parts.back().length, 500 * MIB - 62 * 8 * MIB);
	checkContiguous(plan, 500 * MIB);

	planner.plan(5 * GIB, 0, 0, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 32 * MIB);
	BOOST_CHECK_EQUAL(plan.concurrency, 5);
	BOOST_CHECK_EQUAL(plan.parts.size(), 160);
	checkContiguous(plan, 5 * GIB);

	planner.plan(20 * GIB, 0, 0, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 64 * MIB);
	BOOST_CHECK_EQUAL(plan.concurrency, 2);
	BOOST_CHECK_EQUAL(plan.parts.size(), 320);
	checkContiguous(plan, 20 * GIB);
}

BOOST_AUTO_TEST_CASE(TierBoundaryBelongsToNextTier)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	planner.plan(1 * GIB - 1, 0, 0, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 8 * MIB);

	planner.plan(1 * GIB, 0, 0, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 32 * MIB);
}

BOOST_AUTO_TEST_CASE(OverridesAndClamping)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	planner.plan(100 * MIB, 16 * MIB, 3, plan);
	BOOST_CHECK_EQUAL(plan.chunkSize, 16 * MIB);
	BOOST_CHECK_EQUAL(plan.concurrency, 3);
	BOOST_CHECK_EQUAL(plan.parts.size(), 7);
	checkContiguous(plan, 100 * MIB);

	planner.plan(100 * MIB, 0, 500, plan);
	BOOST_CHECK_EQUAL(plan.concurrency, UPLOADCONFIG_MAX_CONCURRENCY);
}

BOOST_AUTO_TEST_CASE(ChunkBelowMinimumIsRejected)
{
	UploadConfig config;
	PartPlanner planner(config);
	PartPlan plan;

	try
	{
		planner.plan(100 * MIB, 1 * MIB, 0, plan);
		BOOST_FAIL("Expected exception for chunk size below backend minimum");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_INVALIDPOLICY);
	}
}

BOOST_AUTO_TEST_CASE(TooManyPartsIsRejected)
{
	UploadConfig config;
	config.maxNumParts = 10;

	PartPlanner planner(config);
	PartPlan plan;

	try
	{
		planner.plan(100 * MIB, 8 * MIB, 0, plan);
		BOOST_FAIL("Expected exception for too many parts");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_INVALIDPOLICY);
	}

	planner.plan(80 * MIB, 8 * MIB, 0, plan);
	BOOST_CHECK_EQUAL(plan.parts.size(), 10);
}

BOOST_AUTO_TEST_CASE(ChunkAboveMaximumIsRejected)
{
	UploadConfig config;
	config.maxPartSize = 16 * MIB;

	PartPlanner planner(config);
	PartPlan plan;

	BOOST_CHECK_THROW(planner.plan(100 * MIB, 32 * MIB, 0, plan), UploadException);
}

BOOST_AUTO_TEST_CASE(SinglePartBelowMinimumIsAllowed)
{
	UploadConfig config;
	config.sizePolicy.multipartThreshold = 1024;
	config.sizePolicy.tiers = { {0, 4096, 2} };

	PartPlanner planner(config);
	PartPlan plan;

	// one part only, so the minimum for non-final parts doesn't apply
	planner.plan(2000, 0, 0, plan);

	BOOST_CHECK_EQUAL(plan.parts.size(), 1);
	BOOST_CHECK_EQUAL(plan.parts[0].length, 2000);
}
