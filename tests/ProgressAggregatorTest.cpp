// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#define BOOST_TEST_MODULE ProgressAggregatorTest

#include <boost/test/unit_test.hpp>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "ProgressAggregator.h"


/**
 * Records all callback invocations.
 */
struct ProgressRecorder
{
	std::mutex mutex;
	std::vector<uint64_t> bytesDoneVec;
	std::vector<double> percentVec;
	unsigned numConcurrentCalls{0};
	unsigned maxConcurrentCalls{0};

	ProgressCallback makeCallback()
	{
		return [this](double percent, uint64_t numBytesDone, uint64_t numBytesTotal)
		{
			{
				std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

				numConcurrentCalls++;
				maxConcurrentCalls = std::max(maxConcurrentCalls, numConcurrentCalls);
				bytesDoneVec.push_back(numBytesDone);
				percentVec.push_back(percent);
			}

			std::this_thread::yield();

			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			numConcurrentCalls--;
		};
	}
};

BOOST_AUTO_TEST_CASE(UnthrottledReportsEveryPart)
{
	ProgressRecorder recorder;
	ProgressAggregator aggregator(100, recorder.makeCallback(), 0);

	aggregator.addCompletedBytes(25);
	aggregator.addCompletedBytes(25);
	aggregator.addCompletedBytes(50);
	aggregator.notifyFinished(); // final value was already reported

	BOOST_REQUIRE_EQUAL(recorder.bytesDoneVec.size(), 3);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec[0], 25);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec[1], 50);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec[2], 100);
	BOOST_CHECK_CLOSE(recorder.percentVec[2], 100.0, 0.001);
}

BOOST_AUTO_TEST_CASE(ThrottledKeepsFirstAndFinal)
{
	ProgressRecorder recorder;
	ProgressAggregator aggregator(1000, recorder.makeCallback(), 60 * 1000);

	for(unsigned i=0; i < 10; i++)
		aggregator.addCompletedBytes(100);

	aggregator.notifyFinished();

	BOOST_REQUIRE_EQUAL(recorder.bytesDoneVec.size(), 2);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec.front(), 100);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec.back(), 1000);
}

BOOST_AUTO_TEST_CASE(InitialBytesFromResume)
{
	ProgressRecorder recorder;
	ProgressAggregator aggregator(100, recorder.makeCallback(), 0);

	aggregator.setInitialBytes(60);
	BOOST_CHECK(recorder.bytesDoneVec.empty() );
	BOOST_CHECK_EQUAL(aggregator.getNumBytesDone(), 60);

	aggregator.setInitialBytes(30); // never lowers
	BOOST_CHECK_EQUAL(aggregator.getNumBytesDone(), 60);

	aggregator.addCompletedBytes(20);
	BOOST_REQUIRE_EQUAL(recorder.bytesDoneVec.size(), 1);
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec[0], 80);
	BOOST_CHECK_CLOSE(aggregator.getPercent(), 80.0, 0.001);
}

BOOST_AUTO_TEST_CASE(ConcurrentUpdatesAreMonotonicAndSerialized)
{
	const unsigned numThreads = 8;
	const unsigned numPartsPerThread = 200;

	ProgressRecorder recorder;
	ProgressAggregator aggregator(numThreads * numPartsPerThread * 10, recorder.makeCallback(),
		0);

	std::vector<std::thread> threads;

	for(unsigned i=0; i < numThreads; i++)
		threads.emplace_back( [&]
		{
			for(unsigned j=0; j < numPartsPerThread; j++)
				aggregator.addCompletedBytes(10);
		} );

	for(std::thread& thread : threads)
		thread.join();

	aggregator.notifyFinished();

	BOOST_CHECK_EQUAL(recorder.maxConcurrentCalls, 1);
	BOOST_REQUIRE(!recorder.bytesDoneVec.empty() );
	BOOST_CHECK_EQUAL(recorder.bytesDoneVec.back(), numThreads * numPartsPerThread * 10);

	for(size_t i=1; i < recorder.bytesDoneVec.size(); i++)
		BOOST_CHECK(recorder.bytesDoneVec[i] >= recorder.bytesDoneVec[i-1] );

	// the final value is reported exactly once
	unsigned numFinalReports = 0;
	for(uint64_t bytesDone : recorder.bytesDoneVec)
		if(bytesDone == numThreads * numPartsPerThread * 10)
			numFinalReports++;

	BOOST_CHECK_EQUAL(numFinalReports, 1);
}

BOOST_AUTO_TEST_CASE(FailingCallbackDoesNotPropagate)
{
	ProgressAggregator aggregator(100,
		[](double percent, uint64_t numBytesDone, uint64_t numBytesTotal)
		{
			throw std::runtime_error("callback failure");
		}, 0);

	BOOST_CHECK_NO_THROW(aggregator.addCompletedBytes(50) );
	BOOST_CHECK_EQUAL(aggregator.getNumBytesDone(), 50);
}

BOOST_AUTO_TEST_CASE(EmptyCallback)
{
	ProgressAggregator aggregator(100, ProgressCallback(), 0);

	BOOST_CHECK_NO_THROW(aggregator.addCompletedBytes(100) );
	BOOST_CHECK_NO_THROW(aggregator.notifyFinished() );
	BOOST_CHECK_EQUAL(aggregator.getNumBytesDone(), 100);
}
