// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef WORKERS_WORKEREXCEPTION_H_
#define WORKERS_WORKEREXCEPTION_H_

#include "ProgException.h"

/**
 * For errors with explanation message in worker threads, e.g. failed read of the local source file.
 */
class WorkerException : public ProgException
{
	public:
		explicit WorkerException(const std::string& errorMessage) : ProgException(errorMessage) {};
};


/**
 * For use by worker threads which noticed that they have been friendly interrupted, either by
 * user abort or by pool-wide cancellation after a fatal error of another worker.
 */
class WorkerInterruptedException : public WorkerException
{
	public:
		explicit WorkerInterruptedException(const std::string& errorMessage) :
			WorkerException(errorMessage) {};
};


#endif /* WORKERS_WORKEREXCEPTION_H_ */
