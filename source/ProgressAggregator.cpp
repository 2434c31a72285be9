// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>
#include "Logger.h"
#include "ProgressAggregator.h"


/**
 * @callback may be empty if caller is not interested in progress notifications.
 * @minIntervalMS minimum time between two callback invocations; 0 to notify on every part.
 */
ProgressAggregator::ProgressAggregator(uint64_t numBytesTotal, ProgressCallback callback,
	unsigned minIntervalMS) :
	numBytesTotal(numBytesTotal), callback(callback), minInterval(minIntervalMS)
{
}

/**
 * Set bytes that were already uploaded before this aggregator was created, e.g. on resume. Does
 * not invoke the callback and never lowers the current value.
 */
void ProgressAggregator::setInitialBytes(uint64_t numBytesDone)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	if(numBytesDone > this->numBytesDone)
		this->numBytesDone = std::min(numBytesDone, numBytesTotal);
}

/**
 * Add bytes of a part that was acknowledged by the backend. Called concurrently by workers.
 */
void ProgressAggregator::addCompletedBytes(uint64_t numBytes)
{
	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

		numBytesDone = std::min(numBytesDone + numBytes, numBytesTotal);

		const std::chrono::steady_clock::time_point nowT = std::chrono::steady_clock::now();

		bool isFirst = !hasNotified;
		bool isFinal = (numBytesDone == numBytesTotal);
		bool isIntervalElapsed = ( (nowT - lastNotifyT) >= minInterval);

		if(!isFirst && !isFinal && !isIntervalElapsed)
			return; // throttled

		hasNotified = true;
		lastNotifyT = nowT;
	}

	invokeCallback();
}

/**
 * Called after successful completion of the whole upload. Notifies the final 100% unless that was
 * already reported.
 */
void ProgressAggregator::notifyFinished()
{
	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

		numBytesDone = numBytesTotal;
		hasNotified = true;
		lastNotifyT = std::chrono::steady_clock::now();
	}

	invokeCallback();
}

/**
 * Invoke the callback with the current value. The value is read while holding callbackMutex, so
 * that callers see a non-decreasing sequence even if workers race here.
 */
void ProgressAggregator::invokeCallback()
{
	std::unique_lock<std::mutex> callbackLock(callbackMutex); // L O C K (scoped)

	uint64_t currentBytesDone;

	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

		currentBytesDone = numBytesDone;

		if(currentBytesDone == numBytesTotal)
		{
			if(isFinalReported)
				return; // final value was already reported

			isFinalReported = true;
		}
	}

	if(!callback)
		return;

	double percent = numBytesTotal ? ( (100.0 * currentBytesDone) / numBytesTotal) : 100;

	try
	{
		callback(percent, currentBytesDone, numBytesTotal);
	}
	catch(std::exception& e)
	{
		ERRLOGGER(Log_NORMAL, "Progress callback failed: " << e.what() << std::endl);
	}
}
