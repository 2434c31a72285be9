// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include "Coordinator.h"
#include "ProgException.h"
#include "storage/S3StorageClient.h"
#include "toolkits/S3Tk.h"
#include "toolkits/SignalTk.h"
#include "toolkits/StringTk.h"
#include "toolkits/TerminalTk.h"
#include "toolkits/TranslatorTk.h"
#include "toolkits/UnitTk.h"

#define COORDINATOR_SIGNALWAIT_MS		250 // interval to check if upload thread is done


/**
 * The entry point to run the user-selected command.
 *
 * @return value is suitable to use as application main() return value, so 0 on success and non-zero
 * 		otherwise.
 */
int Coordinator::main()
{
	int retVal = EXIT_SUCCESS;

	/* block interrupt signals before any other threads get started (including the AWS SDK
		threads), so that they can be received synchronously by the main thread. */
	SignalTk::blockInterruptSignals();

	const UploadConfig& config = progArgs.getUploadConfig();

	S3Tk::initS3Global(config);

	try
	{
		std::shared_ptr<StorageClient> storageClient = std::make_shared<S3StorageClient>(config);

		UploadOrchestrator orchestrator(config, storageClient);

		runCommand(orchestrator);
	}
	catch(UploadException& e)
	{
		ErrLogger() << e.what() << "; "
			"Type: " << TranslatorTk::uploadErrorTypeToStr(e.getErrorType() ) << std::endl;

		if(!e.getSessionID().empty() )
			Logger() << "NOTE: Session " << e.getSessionID() << " can be resumed with: "
				EXE_NAME " " COMMAND_RESUME_STR " " << e.getSessionID() << std::endl;

		retVal = EXIT_FAILURE;
	}
	catch(ProgException& e)
	{
		ErrLogger() << e.what() << std::endl;
		retVal = EXIT_FAILURE;
	}

	S3Tk::uninitS3Global();

	return retVal;
}

void Coordinator::runCommand(UploadOrchestrator& orchestrator)
{
	const StringVec& commandArgsVec = progArgs.getCommandArgsVec();

	switch(progArgs.getCommand() )
	{
		case Command_UPLOAD:
		{
			const std::string& localPath = commandArgsVec[0];

			UploadOptions options;
			options.objectKey = progArgs.getObjectKey().empty() ?
				StringTk::generateDefaultObjectKey(localPath, time(NULL) ) :
				progArgs.getObjectKey();
			options.contentType = progArgs.getContentType();
			options.metadata = progArgs.getMetadataMap();
			options.chunkSize = progArgs.getChunkSize();
			options.concurrency = progArgs.getNumThreads();
			options.progressCallback = makeProgressCallback();

			const std::string sessionID = orchestrator.getSessionID(progArgs.getBucketRole(),
				options.objectKey);

			UploadResult result = runUploadCommand(orchestrator, sessionID,
				[&] { return orchestrator.upload(localPath, progArgs.getBucketRole(), options); } );

			printUploadResult(result);
		} break;

		case Command_RESUME:
		{
			UploadResult result;

			if(progArgs.getIsBucketRoleGiven() )
			{ // resume by local path, role and key
				const std::string& localPath = commandArgsVec[0];
				const std::string sessionID = orchestrator.getSessionID(
					progArgs.getBucketRole(), progArgs.getObjectKey() );

				result = runUploadCommand(orchestrator, sessionID,
					[&] { return orchestrator.resume(localPath, progArgs.getBucketRole(),
						progArgs.getObjectKey(), makeProgressCallback() ); } );
			}
			else
			{
				const std::string& sessionID = commandArgsVec[0];

				result = runUploadCommand(orchestrator, sessionID,
					[&] { return orchestrator.resume(sessionID, makeProgressCallback() ); } );
			}

			printUploadResult(result);
		} break;

		case Command_ABORT:
		{
			orchestrator.abort(commandArgsVec[0] );

			std::cout << "Aborted: " << commandArgsVec[0] << std::endl;
		} break;

		case Command_PROGRESS:
		{
			ProgressSnapshot snapshot;

			orchestrator.getProgress(commandArgsVec[0], snapshot);

			printProgress(commandArgsVec[0], snapshot);
		} break;

		case Command_LIST:
		{
			if(progArgs.getListRemoteUploads() )
			{
				RemoteUploadVec remoteUploads;

				orchestrator.listRemoteUploads(progArgs.getBucketRole(), progArgs.getKeyPrefix(),
					remoteUploads);

				printRemoteUploadList(remoteUploads);
			}
			else
			{
				UploadSessionVec sessions;

				orchestrator.listActiveSessions(progArgs.getBucketRole(), sessions);

				printSessionList(sessions);
			}
		} break;

		case Command_INFO:
		{
			ObjectInfo info;

			if(!orchestrator.getObjectInfo(progArgs.getBucketRole(), progArgs.getObjectKey(),
				info) )
				throw ProgException("Object not found: " + progArgs.getObjectKey() );

			printObjectInfo(progArgs.getObjectKey(), info);
		} break;

		case Command_PRESIGN:
		{
			std::cout << orchestrator.presignURL(progArgs.getBucketRole(),
				progArgs.getObjectKey(), progArgs.getPresignTTLSecs() ) << std::endl;
		} break;

		case Command_CLEANUP:
		{
			size_t numPurged = orchestrator.purgeExpiredSessions();

			std::cout << "Purged expired sessions: " << numPurged << std::endl;
		} break;
	}
}

/**
 * Run an upload or resume with console progress line.
 */
UploadResult Coordinator::runUploadCommand(UploadOrchestrator& orchestrator,
	const std::string& sessionID, std::function<UploadResult()> uploadFunc)
{
	const bool showProgressLine = !progArgs.getDisableProgressLine() &&
		TerminalTk::isStdoutTTY();

	progressStartT = std::chrono::steady_clock::now();

	if(showProgressLine)
	{
		TerminalTk::disableConsoleBuffering();
		LoggerBase::setErrToStdout(true); // to not break the progress line
	}

	try
	{
		UploadResult result = watchUploadThread(orchestrator, sessionID, uploadFunc);

		if(showProgressLine)
		{
			std::cout << std::endl;
			LoggerBase::setErrToStdout(false);
			TerminalTk::resetConsoleBuffering();
		}

		return result;
	}
	catch(ProgException& e)
	{
		if(showProgressLine)
		{
			std::cout << std::endl;
			LoggerBase::setErrToStdout(false);
			TerminalTk::resetConsoleBuffering();
		}

		throw;
	}
}

/**
 * Run uploadFunc in a separate thread and wait for it to finish. An interrupt signal during the
 * wait gets turned into an abort of the given session.
 *
 * @throw the exception that uploadFunc threw.
 */
UploadResult Coordinator::watchUploadThread(UploadOrchestrator& orchestrator,
	const std::string& sessionID, std::function<UploadResult()> uploadFunc)
{
	UploadResult result;
	std::exception_ptr uploadErrorPtr;
	std::atomic_bool isUploadDone(false);

	std::thread uploadThread( [&]
		{
			try
			{
				result = uploadFunc();
			}
			catch(std::exception& e)
			{
				uploadErrorPtr = std::current_exception();
			}

			isUploadDone = true;
		} );

	bool isAbortPending = false; // signal received, abort not sent yet
	bool isAbortSent = false;

	while(!isUploadDone)
	{
		int signalNum = SignalTk::waitForInterruptSignal(COORDINATOR_SIGNALWAIT_MS);

		if(signalNum && !isAbortPending && !isAbortSent)
		{
			Logger() << std::endl << "Received signal " << signalNum << ". Aborting upload. "
				"SessionID: " << sessionID << std::endl;

			isAbortPending = true;
		}

		if(!isAbortPending)
			continue;

		// abort must not register the session before the upload thread did
		if(!orchestrator.isUploadActive(sessionID) )
			continue;

		isAbortPending = false;

		try
		{
			orchestrator.abort(sessionID); // returns when upload has stopped
			isAbortSent = true;
		}
		catch(UploadException& e)
		{ // upload might have finished in the meantime
			ERRLOGGER(Log_NORMAL, "Abort request failed. " << e.what() << std::endl);
		}
	}

	uploadThread.join();

	if(uploadErrorPtr)
		std::rethrow_exception(uploadErrorPtr);

	return result;
}

void Coordinator::printUploadResult(const UploadResult& result)
{
	if(result.status == SessionStatus_ABORTED)
	{
		std::cout << "Upload aborted. SessionID: " << result.sessionID << std::endl;
		return;
	}

	std::chrono::milliseconds elapsedMS =
		std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - progressStartT);

	std::cout << "Upload completed." << std::endl <<
		" * SessionID: " << result.sessionID << std::endl <<
		" * Bucket: " << result.object.bucketName << std::endl <<
		" * Key: " << result.object.objectKey << std::endl <<
		" * Size: " << UnitTk::bytesToHumanStrBinary(result.object.size) << std::endl <<
		" * ETag: " << result.object.eTag << std::endl <<
		" * URL: " << result.object.url << std::endl <<
		" * Elapsed: " << UnitTk::elapsedSecToHumanStr(elapsedMS.count() / 1000) << std::endl;
}

void Coordinator::printProgress(const std::string& sessionID, const ProgressSnapshot& snapshot)
{
	std::cout << "SessionID: " << sessionID << std::endl <<
		" * Progress: " << snapshot.percent << "%" << std::endl <<
		" * Bytes: " << UnitTk::bytesToHumanStrBinary(snapshot.numBytesDone) << " / " <<
			UnitTk::bytesToHumanStrBinary(snapshot.numBytesTotal) << std::endl <<
		" * Parts: " << snapshot.numPartsDone << " / " << snapshot.numPartsTotal << std::endl <<
		" * Uploading: " << snapshot.numPartsUploading << std::endl;
}

void Coordinator::printSessionList(const UploadSessionVec& sessions)
{
	if(sessions.empty() )
	{
		std::cout << "No resumable sessions." << std::endl;
		return;
	}

	for(const UploadSession& session : sessions)
	{
		ProgressSnapshot snapshot;
		session.computeProgress(snapshot);

		std::cout << session.sessionID << " " <<
			TranslatorTk::sessionStatusToStr(session.status) << " " <<
			snapshot.numPartsDone << "/" << snapshot.numPartsTotal << " " <<
			UnitTk::bytesToHumanStrBinary(session.totalSize) << " " <<
			StringTk::timeToStr(session.updatedAt) << " " <<
			session.objectKey << " " << session.localPath << std::endl;
	}
}

void Coordinator::printRemoteUploadList(const RemoteUploadVec& remoteUploads)
{
	if(remoteUploads.empty() )
	{
		std::cout << "No in-progress multipart uploads." << std::endl;
		return;
	}

	for(const RemoteUpload& remoteUpload : remoteUploads)
		std::cout << StringTk::timeToStr(remoteUpload.initiated) << " " <<
			remoteUpload.objectKey << " " << remoteUpload.uploadID << std::endl;
}

void Coordinator::printObjectInfo(const std::string& objectKey, const ObjectInfo& info)
{
	std::cout << "Key: " << objectKey << std::endl <<
		" * Size: " << info.size << " (" << UnitTk::bytesToHumanStrBinary(info.size) << ")" <<
			std::endl <<
		" * ETag: " << info.eTag << std::endl <<
		" * ContentType: " << info.contentType << std::endl <<
		" * LastModified: " << StringTk::timeToStr(info.lastModified) << std::endl;

	for(const auto& metadataPair : info.metadata)
		std::cout << " * Metadata: " << metadataPair.first << "=" << metadataPair.second <<
			std::endl;
}

/**
 * @return callback that rewrites the console progress line; empty callback if disabled.
 */
ProgressCallback Coordinator::makeProgressCallback()
{
	if(progArgs.getDisableProgressLine() || !TerminalTk::isStdoutTTY() )
		return ProgressCallback();

	return [this](double percent, uint64_t numBytesDone, uint64_t numBytesTotal)
	{
		std::chrono::milliseconds elapsedMS =
			std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - progressStartT);

		TerminalTk::rewriteConsoleLine(TerminalTk::makeProgressLine(percent, numBytesDone,
			numBytesTotal, elapsedMS.count() ) );
	};
}
