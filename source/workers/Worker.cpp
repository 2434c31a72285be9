// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include "Logger.h"
#include "Worker.h"
#include "WorkerException.h"


/**
 * Thread entry point: call run method of the given worker and its cleanup afterwards.
 */
void Worker::threadStart(Worker* worker)
{
	worker->run();
	worker->cleanup();
}

/**
 * Let the pool know that this worker is done with its work, either because no parts are left or
 * because it has been friendly interrupted.
 */
void Worker::incNumWorkersDone()
{
	LOGGER(Log_DEBUG, "Worker done. "
		"WorkerRank: " << workerRank << std::endl);

	workersSharedData->incNumWorkersDone();
}

/**
 * Let the pool know that this worker stopped with a fatal error.
 */
void Worker::incNumWorkersDoneWithError()
{
	ErrLogger(Log_DEBUG) << "Increasing done with error counter. " <<
		"WorkerRank: " << this->workerRank << std::endl;

	workersSharedData->incNumWorkersDoneWithError();
}

/**
 * Check if this worker has been friendly asked to interrupt itself. Caller must hold
 * workersSharedData->mutex.
 *
 * @throw WorkerInterruptedException if friendly ask to interrupt has been received.
 */
void Worker::checkInterruptionRequestUnlocked()
{
	IF_UNLIKELY(workersSharedData->isInterruptionRequested)
		throw WorkerInterruptedException("Received friendly request to interrupt execution.");
}
