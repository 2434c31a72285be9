// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef PROGRESSAGGREGATOR_H_
#define PROGRESSAGGREGATOR_H_

#include <chrono>
#include <mutex>
#include "Common.h"


/**
 * Thread-safe accumulator of acknowledged bytes of one upload. Converts part completions into
 * overall progress and forwards it to the caller's callback, throttled to at most one call per
 * interval. The first and the final notification are never throttled.
 *
 * The reported byte count never decreases and callback invocations never overlap.
 */
class ProgressAggregator
{
	public:
		ProgressAggregator(uint64_t numBytesTotal, ProgressCallback callback,
			unsigned minIntervalMS);

		void setInitialBytes(uint64_t numBytesDone);
		void addCompletedBytes(uint64_t numBytes);
		void notifyFinished();

	private:
		std::mutex mutex; // protects counters and throttling state
		std::mutex callbackMutex; // serializes callback invocations
		const uint64_t numBytesTotal;
		uint64_t numBytesDone{0};
		ProgressCallback callback; // may be empty
		const std::chrono::milliseconds minInterval;
		std::chrono::steady_clock::time_point lastNotifyT;
		bool hasNotified{false}; // true after first callback invocation was scheduled
		bool isFinalReported{false}; // true after callback got the 100% value

		void invokeCallback();

	// inliners
	public:
		uint64_t getNumBytesDone()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return numBytesDone;
		}

		double getPercent()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			return numBytesTotal ? ( (100.0 * numBytesDone) / numBytesTotal) : 0;
		}
};


#endif /* PROGRESSAGGREGATOR_H_ */
