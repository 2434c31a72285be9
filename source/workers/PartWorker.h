// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef WORKERS_PARTWORKER_H_
#define WORKERS_PARTWORKER_H_

#include "Worker.h"


/**
 * Worker thread of the upload pool. Claims pending parts one at a time, reads their byte range
 * through its own file descriptor and uploads them, retrying transient backend errors with
 * exponential backoff.
 */
class PartWorker : public Worker
{
	public:
		explicit PartWorker(WorkersSharedData* workersSharedData, size_t workerRank) :
			Worker(workersSharedData, workerRank) {}

		~PartWorker()
		{
			cleanup();
		}


	protected:
		virtual void run() override;
		virtual void cleanup() override;


	private:
		int fd{-1}; // independent read-only handle of the source file
		char* ioBuf{NULL}; // buffer for the current part
		size_t ioBufSize{0};

		void openSourceFile();
		void allocIOBuffer(uint64_t bufSize);
		bool claimNextPart(unsigned& outPartNumber, uint64_t& outOffset, uint64_t& outLength);
		void uploadClaimedPart(unsigned partNumber, uint64_t offset, uint64_t length);
		void markPartFailed(unsigned partNumber);
		void releaseClaimedPart(unsigned partNumber);
};

#endif /* WORKERS_PARTWORKER_H_ */
