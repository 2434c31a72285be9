// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef WORKERS_WORKER_H_
#define WORKERS_WORKER_H_

#include <iostream>
#include "WorkersSharedData.h"


/**
 * Generic interface for worker threads of the upload pool.
 */
class Worker
{
	public:
		explicit Worker(WorkersSharedData* workersSharedData, size_t workerRank) :
			workersSharedData(workersSharedData), config(workersSharedData->config),
			workerRank(workerRank) {}

		virtual ~Worker() {}

		static void threadStart(Worker* worker);


	protected:
		WorkersSharedData* workersSharedData; // common data for all workers
		const UploadConfig* config; // shortcut for member of workersSharedData
		size_t workerRank; // rank of this worker in range 0 to numWorkers-1

		virtual void run() = 0;
		virtual void cleanup() {}; // cleanup that needs to be done after run()

		void incNumWorkersDone();
		void incNumWorkersDoneWithError();
		void checkInterruptionRequestUnlocked();
};

#endif /* WORKERS_WORKER_H_ */
