// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>
#include "Logger.h"
#include "PartWorker.h"
#include "toolkits/SignalTk.h"
#include "toolkits/TranslatorTk.h"
#include "UploadException.h"
#include "WorkerException.h"
#include "WorkerManager.h"


WorkerManager::WorkerManager(const UploadConfig& config, StorageClient& storageClient,
	SessionStore& sessionStore) :
	config(config), storageClient(storageClient), sessionStore(sessionStore)
{
	workersSharedData.config = &config;
	workersSharedData.storageClient = &storageClient;
	workersSharedData.sessionStore = &sessionStore;
	workersSharedData.progressAggregator = NULL;
	workersSharedData.session = NULL;
}

WorkerManager::~WorkerManager()
{
	// (threads might still be running if runPool was left through an exception)
	interruptAndNotifyWorkers(false);
	joinAllThreads();
	deleteThreads();
}

/**
 * Upload all pending parts of the given session with up to session.concurrency worker threads and
 * wait for them to finish.
 *
 * A fatal error of one worker cancels the pool: the others finish their current part and stop
 * claiming new ones. The remote multipart upload stays untouched, so the caller can decide between
 * resume and abort.
 *
 * @session part records get updated and persisted by the workers.
 * @return PoolResult_ABORTED if interrupted through interruptAndNotifyWorkers(true).
 * @throw UploadException on fatal worker error, with session ID and part number of the first
 * 		failing worker.
 */
PoolResult WorkerManager::runPool(UploadSession& session, ProgressAggregator& progressAggregator)
{
	workersSharedData.session = &session;
	workersSharedData.progressAggregator = &progressAggregator;

	size_t numPendingParts = std::count_if(session.parts.begin(), session.parts.end(),
		[](const PartRecord& part) { return part.status == PartStatus_PENDING; } );

	size_t numWorkers = std::min( (size_t)session.concurrency, numPendingParts);

	LOGGER(Log_DEBUG, "Starting worker pool. "
		"SessionID: " << session.sessionID << "; "
		"PendingParts: " << numPendingParts << "; "
		"NumWorkers: " << numWorkers << std::endl);

	if(numWorkers)
	{
		prepareThreads(numWorkers);
		waitForWorkersDone();
		joinAllThreads();
		deleteThreads();
	}

	std::unique_lock<std::mutex> lock(workersSharedData.mutex); // L O C K (scoped)

	if(workersSharedData.isAbortRequested)
		return PoolResult_ABORTED;

	rethrowFirstErrorUnlocked();

	for(const PartRecord& part : session.parts)
	{
		IF_UNLIKELY(part.status != PartStatus_UPLOADED)
			throw UploadException(UploadErr_INVALIDSTATE, "Worker pool finished with parts that "
				"have not been uploaded. "
				"Status: " + TranslatorTk::partStatusToStr(part.status),
				session.sessionID, part.partNumber);
	}

	return PoolResult_SUCCESS;
}

/**
 * Friendly ask all workers to stop claiming new parts. In-flight part uploads are not cut off.
 *
 * @isUserAbort true if this is a user abort, which makes runPool() return PoolResult_ABORTED.
 */
void WorkerManager::interruptAndNotifyWorkers(bool isUserAbort)
{
	std::unique_lock<std::mutex> lock(workersSharedData.mutex); // L O C K (scoped)

	workersSharedData.interruptWorkersUnlocked(isUserAbort);
}

/**
 * Create worker objects and start their threads.
 */
void WorkerManager::prepareThreads(size_t numWorkers)
{
	for(size_t i=0; i < numWorkers; i++)
	{
		Worker* newWorker = new PartWorker(&workersSharedData, i);
		workerVec.push_back(newWorker);
	}

	for(size_t i=0; i < workerVec.size(); i++)
	{
		/* Linux can send process signals to any thread, so ensure that workers have SIGINT/SIGTERM
			blocked and only the main thread receives it. */
		sigset_t oldSignalMask;

		SignalTk::blockInterruptSignals(&oldSignalMask);
		std::thread* thread = new std::thread(Worker::threadStart, workerVec[i] );
		SignalTk::restoreSignalMask(oldSignalMask); // restore for current thread
		threadGroup.push_back(thread);
	}
}

/**
 * Wait for all started workers to be done, successfully or with error.
 */
void WorkerManager::waitForWorkersDone()
{
	std::unique_lock<std::mutex> lock(workersSharedData.mutex); // L O C K (scoped)

	workersSharedData.condition.wait(lock,
		[&, this]
		{
			size_t numWorkersDone;
			return checkWorkersDoneUnlocked(&numWorkersDone);
		} );
}

/**
 * Caller must hold workersSharedData.mutex.
 *
 * @outNumWorkersDone number of finished workers, including those with error.
 * @return true if all workers are done.
 */
bool WorkerManager::checkWorkersDoneUnlocked(size_t* outNumWorkersDone)
{
	*outNumWorkersDone = workersSharedData.numWorkersDone +
		workersSharedData.numWorkersDoneWithError;

	return (*outNumWorkersDone == workerVec.size() );
}

/**
 * Join all threads in threadGroup and wait for them to terminate.
 */
void WorkerManager::joinAllThreads()
{
	for(std::thread* thread : threadGroup)
		if(thread->joinable() )
			thread->join();
}

/**
 * Delete all worker threads objects. Caller must ensure that all threads are stopped.
 */
void WorkerManager::deleteThreads()
{
	for(std::thread* thread : threadGroup)
		delete(thread);

	threadGroup.resize(0);

	for(Worker* worker : workerVec)
		delete(worker);

	workerVec.resize(0);
}

/**
 * Caller must hold workersSharedData.mutex.
 *
 * @throw UploadException with type matching the error of the first failing worker.
 */
void WorkerManager::rethrowFirstErrorUnlocked()
{
	if(!workersSharedData.firstErrorPtr)
		return;

	const std::string& sessionID = workersSharedData.session->sessionID;
	const unsigned partNumber = workersSharedData.firstErrorPartNumber;

	try
	{
		std::rethrow_exception(workersSharedData.firstErrorPtr);
	}
	catch(UploadException& e)
	{
		throw;
	}
	catch(std::exception& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(), sessionID,
			partNumber);
	}
}
