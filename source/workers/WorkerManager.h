// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef WORKERS_WORKERMANAGER_H_
#define WORKERS_WORKERMANAGER_H_

#include "Worker.h"
#include "WorkersSharedData.h"


enum PoolResult
{
	PoolResult_SUCCESS = 0, // all parts uploaded
	PoolResult_ABORTED, // interrupted by user abort
};


/**
 * Bounded pool of PartWorker threads for one upload.
 */
class WorkerManager
{
	public:
		WorkerManager(const UploadConfig& config, StorageClient& storageClient,
			SessionStore& sessionStore);
		~WorkerManager();

		PoolResult runPool(UploadSession& session, ProgressAggregator& progressAggregator);
		void interruptAndNotifyWorkers(bool isUserAbort);


	private:
		const UploadConfig& config;
		StorageClient& storageClient;
		SessionStore& sessionStore;
		ThreadGroup threadGroup;
		WorkerVec workerVec;
		WorkersSharedData workersSharedData;

		void prepareThreads(size_t numWorkers);
		void waitForWorkersDone();
		bool checkWorkersDoneUnlocked(size_t* outNumWorkersDone);
		void joinAllThreads();
		void deleteThreads();
		void rethrowFirstErrorUnlocked();

	// inliners
	public:
		/**
		 * Mutex that protects the part records of the session while workers are running.
		 */
		std::mutex& getSessionMutex() { return workersSharedData.mutex; }
};

#endif /* WORKERS_WORKERMANAGER_H_ */
