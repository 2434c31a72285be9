// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef WORKERS_WORKERSSHAREDDATA_H_
#define WORKERS_WORKERSSHAREDDATA_H_

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>
#include "Common.h"
#include "ProgressAggregator.h"
#include "SessionStore.h"
#include "storage/StorageClient.h"
#include "UploadConfig.h"
#include "UploadSession.h"


class Worker; // forward declaration for WorkerVec;
typedef std::vector<Worker*> WorkerVec;
typedef std::vector<std::thread*> ThreadGroup;


/**
 * Common data for all workers of one upload.
 */
class WorkersSharedData
{
	public:
		const UploadConfig* config;
		StorageClient* storageClient;
		SessionStore* sessionStore;
		ProgressAggregator* progressAggregator;
		UploadSession* session; // part records are protected by mutex

		std::mutex mutex;
		std::condition_variable condition;
		bool isInterruptionRequested{false}; /* true on user abort or after fatal error of a worker
			(protected by mutex, change signaled by condition) */
		bool isAbortRequested{false}; // true if interruption came from user abort
		size_t numWorkersDone{0}; /* number of threads that are through with their work
			(protected by mutex, change signaled by condition) */
		size_t numWorkersDoneWithError{0}; /* number of threads that failed
			(protected by mutex, change signaled by condition) */
		std::exception_ptr firstErrorPtr; // fatal error of first failing worker
		unsigned firstErrorPartNumber{0}; // part of firstErrorPtr; 0 if not part related

		void setFirstErrorUnlocked(std::exception_ptr errorPtr, unsigned partNumber);

	// inliners
	public:
		/**
		 * Friendly ask all workers to stop claiming new parts. Workers in retry backoff wake up
		 * through condition.
		 */
		void interruptWorkersUnlocked(bool isUserAbort)
		{
			isInterruptionRequested = true;

			if(isUserAbort)
				isAbortRequested = true;

			condition.notify_all();
		}

		/**
		 * To be called by a worker that has finished successfully or after interruption.
		 */
		void incNumWorkersDone()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)
			numWorkersDone++;
			condition.notify_all();
		}

		/**
		 * To be called by a worker that has been cancelled with a fatal error.
		 */
		void incNumWorkersDoneWithError()
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)
			numWorkersDoneWithError++;
			condition.notify_all();
		}

};


#endif /* WORKERS_WORKERSSHAREDDATA_H_ */
