// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <chrono>
#include <cstdlib>
#include "Logger.h"
#include "PartWorker.h"
#include "toolkits/FileTk.h"
#include "WorkerException.h"


/**
 * Upload loop: claim and upload parts until none are left or the pool gets interrupted.
 */
void PartWorker::run()
{
	unsigned currentPartNumber = 0; // claimed by this worker, 0 if none

	try
	{
		openSourceFile();
		allocIOBuffer(workersSharedData->session->getMaxPartLength() );

		for( ; ; )
		{
			uint64_t offset;
			uint64_t length;

			if(!claimNextPart(currentPartNumber, offset, length) )
				break; // no pending parts left

			uploadClaimedPart(currentPartNumber, offset, length);

			currentPartNumber = 0;
		}

		incNumWorkersDone();
		return;
	}
	catch(WorkerInterruptedException& e)
	{
		// whoever interrupted us will have a reason for it, so we don't print at normal level here
		ErrLogger(Log_DEBUG) << "Interrupted exception. " <<
			"WorkerRank: " << workerRank << std::endl;

		if(currentPartNumber)
			releaseClaimedPart(currentPartNumber);

		incNumWorkersDone();
		return;
	}
	catch(std::exception& e)
	{
		ErrLogger(Log_VERBOSE) << "Worker stopped with error. " <<
			"WorkerRank: " << workerRank << "; "
			"Part: " << currentPartNumber << "; "
			"Error: " << e.what() << std::endl;

		if(currentPartNumber)
			markPartFailed(currentPartNumber);

		std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

		workersSharedData->setFirstErrorUnlocked(std::current_exception(), currentPartNumber);
	}

	incNumWorkersDoneWithError();
}

void PartWorker::cleanup()
{
	if(fd != -1)
	{
		close(fd);
		fd = -1;
	}

	SAFE_FREE(ioBuf);
	ioBufSize = 0;
}

/**
 * Open own read-only handle of the source file, so that workers don't contend on a shared file
 * offset.
 *
 * @throw WorkerException on error.
 */
void PartWorker::openSourceFile()
{
	const std::string& localPath = workersSharedData->session->localPath;

	fd = open(localPath.c_str(), O_RDONLY);

	IF_UNLIKELY(fd == -1)
		throw WorkerException("Unable to open source file. "
			"Path: " + localPath + "; "
			"SysErr: " + strerror(errno) );
}

/**
 * @throw WorkerException if allocation fails.
 */
void PartWorker::allocIOBuffer(uint64_t bufSize)
{
	ioBuf = (char*)malloc(bufSize);

	IF_UNLIKELY(!ioBuf)
		throw WorkerException("Memory allocation for part buffer failed. "
			"Buffer size: " + std::to_string(bufSize) );

	ioBufSize = bufSize;
}

/**
 * Claim the next pending part by moving it to uploading state. The status change happens under
 * the shared mutex, so exactly one worker can claim a part.
 *
 * @outPartNumber set to the claimed part even if persisting the claim fails afterwards.
 * @return false if no pending part is left.
 * @throw WorkerInterruptedException if the pool has been interrupted.
 */
bool PartWorker::claimNextPart(unsigned& outPartNumber, uint64_t& outOffset,
	uint64_t& outLength)
{
	std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

	checkInterruptionRequestUnlocked();

	UploadSession& session = *workersSharedData->session;

	for(PartRecord& part : session.parts)
	{
		if(part.status != PartStatus_PENDING)
			continue;

		part.status = PartStatus_UPLOADING;
		part.attemptCount++;
		session.touch();

		outPartNumber = part.partNumber;
		outOffset = part.offset;
		outLength = part.length;

		workersSharedData->sessionStore->saveSession(session);

		return true;
	}

	return false;
}

/**
 * Read the byte range of the claimed part and upload it. Transient backend errors are retried with
 * exponential backoff until the configured number of attempts is exhausted.
 *
 * @throw WorkerInterruptedException if interrupted during retry backoff; WorkerException on local
 * 		read error; StorageException subclass on non-retryable or exhausted backend error.
 */
void PartWorker::uploadClaimedPart(unsigned partNumber, uint64_t offset, uint64_t length)
{
	UploadSession& session = *workersSharedData->session;

	IF_UNLIKELY(length > ioBufSize)
		throw WorkerException("Part length exceeds buffer size. "
			"Part: " + std::to_string(partNumber) + "; "
			"Length: " + std::to_string(length) + "; "
			"BufSize: " + std::to_string(ioBufSize) );

	unsigned numAttempts = 1; // in this run; the claim counted as first attempt

	for( ; ; )
	{
		FileTk::preadFull<WorkerException>(fd, ioBuf, length, offset, session.localPath.c_str() );

		std::string eTag;

		try
		{
			LOGGER(Log_DEBUG, "Uploading part. "
				"Bucket: " << session.bucketName << "; "
				"Key: " << session.objectKey << "; "
				"UploadID: " << session.uploadID << "; "
				"Part: " << partNumber << "; "
				"Length: " << length << std::endl);

			eTag = workersSharedData->storageClient->uploadPart(session.bucketName,
				session.objectKey, session.uploadID, partNumber, ioBuf, length);
		}
		catch(StorageTransientException& e)
		{
			std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

			PartRecord* part = session.getPart(partNumber);

			if(numAttempts >= config->maxPartAttempts)
			{
				ErrLogger(Log_VERBOSE) << "Giving up on part after transient errors. " <<
					"Part: " << partNumber << "; "
					"Attempts: " << numAttempts << "; "
					"TotalAttempts: " << part->attemptCount << "; "
					"Error: " << e.what() << std::endl;

				throw;
			}

			const uint64_t delayMS = config->getRetryDelayMS(numAttempts);

			LOGGER(Log_VERBOSE, "Retrying part after transient error. "
				"Part: " << partNumber << "; "
				"Attempt: " << numAttempts << "; "
				"DelayMS: " << delayMS << "; "
				"Error: " << e.what() << std::endl);

			workersSharedData->condition.wait_for(lock, std::chrono::milliseconds(delayMS),
				[&, this] { return workersSharedData->isInterruptionRequested; } );

			checkInterruptionRequestUnlocked();

			numAttempts++;
			part->attemptCount++;
			session.touch();

			workersSharedData->sessionStore->saveSession(session);

			continue;
		}

		// part acknowledged by backend

		{
			std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

			PartRecord* part = session.getPart(partNumber);

			part->eTag = eTag;
			part->status = PartStatus_UPLOADED;
			session.touch();

			workersSharedData->sessionStore->saveSession(session);
		}

		workersSharedData->progressAggregator->addCompletedBytes(length);

		return;
	}
}

/**
 * Mark the claimed part as failed after a fatal error and persist it. A failing save is only
 * logged here, because the original error is what gets reported.
 */
void PartWorker::markPartFailed(unsigned partNumber)
{
	std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

	UploadSession& session = *workersSharedData->session;
	PartRecord* part = session.getPart(partNumber);

	if(!part || (part->status != PartStatus_UPLOADING) )
		return;

	part->status = PartStatus_FAILED;
	session.touch();

	try
	{
		workersSharedData->sessionStore->saveSession(session);
	}
	catch(ProgException& e)
	{
		ERRLOGGER(Log_NORMAL, "Unable to persist failed part state. " << e.what() << std::endl);
	}
}

/**
 * Give an interrupted claim back, so that a later resume uploads the part again.
 */
void PartWorker::releaseClaimedPart(unsigned partNumber)
{
	std::unique_lock<std::mutex> lock(workersSharedData->mutex); // L O C K (scoped)

	UploadSession& session = *workersSharedData->session;
	PartRecord* part = session.getPart(partNumber);

	if(!part || (part->status != PartStatus_UPLOADING) )
		return;

	part->status = PartStatus_PENDING;
	session.touch();

	try
	{
		workersSharedData->sessionStore->saveSession(session);
	}
	catch(ProgException& e)
	{
		ERRLOGGER(Log_NORMAL, "Unable to persist released part state. " << e.what() << std::endl);
	}
}
