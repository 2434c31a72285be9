// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <chrono>
#include <set>
#include "Logger.h"
#include "toolkits/FileTk.h"
#include "toolkits/StringTk.h"
#include "toolkits/TranslatorTk.h"
#include "UploadOrchestrator.h"


/**
 * @config gets copied.
 * @storageClient shared by all uploads and their worker threads.
 * @throw ProgException on invalid config; UploadException if session store can't be initialized.
 */
UploadOrchestrator::UploadOrchestrator(const UploadConfig& config,
	std::shared_ptr<StorageClient> storageClient) :
	config(config), storageClient(storageClient),
	sessionStore(getCheckedSessionDir(this->config) ), partPlanner(this->config)
{
	if(!this->storageClient)
		throw ProgException("Upload orchestrator requires a storage client.");
}

/**
 * Upload a local file to the bucket of the given role. Blocks until the upload is completed, has
 * been aborted through abort() or has failed.
 *
 * Files below the multipart threshold are uploaded with a single put request. Larger files are
 * uploaded in parts by the worker pool and completed afterwards.
 *
 * An existing session record of the same bucket and key that is left over from a crashed process
 * gets replaced and its remote multipart upload gets aborted.
 *
 * @return result with status Completed or Aborted.
 * @throw UploadException on error; ProgException if no bucket is configured for bucketRole.
 */
UploadResult UploadOrchestrator::upload(const std::string& localPath, BucketRole bucketRole,
	const UploadOptions& options)
{
	const std::string& bucketName = config.getBucketName(bucketRole);

	uint64_t totalSize;

	try
	{
		totalSize = FileTk::getFileSize(localPath);
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, e.what() );
	}

	const std::string objectKey = options.objectKey.empty() ?
		StringTk::generateDefaultObjectKey(localPath, time(NULL) ) : options.objectKey;

	// plan before anything else, so that policy errors surface before any network call
	PartPlan plan;
	partPlanner.plan(totalSize, options.chunkSize, options.concurrency, plan);

	const std::string sessionID = UploadSession::makeSessionID(bucketName, objectKey);

	ActiveUploadPtr activeUpload = registerActiveUpload(sessionID);
	ActiveUploadGuard activeUploadGuard(*this, sessionID);

	replaceStaleSession(sessionID);

	{
		std::unique_lock<std::mutex> lock(
			activeUpload->workerManager.getSessionMutex() ); // L O C K (scoped)

		UploadSession& session = activeUpload->session;

		session.sessionID = sessionID;
		session.localPath = localPath;
		session.bucketRole = bucketRole;
		session.bucketName = bucketName;
		session.objectKey = objectKey;
		session.totalSize = totalSize;
		session.chunkSize = plan.chunkSize;
		session.concurrency = plan.concurrency;
		session.status = SessionStatus_PENDING;
		session.attribs.contentType = options.contentType.empty() ?
			FileTk::getContentTypeByExtension(localPath) : options.contentType;
		session.attribs.metadata = options.metadata;
		session.parts = plan.parts;
		session.createdAt = time(NULL);
		session.updatedAt = session.createdAt;

		sessionStore.createSession(session);
	}

	LOGGER(Log_VERBOSE, "Starting upload. "
		"SessionID: " << sessionID << "; "
		"Path: " << localPath << "; "
		"Bucket: " << bucketName << "; "
		"Key: " << objectKey << "; "
		"Size: " << totalSize << "; "
		"NumParts: " << plan.parts.size() << "; "
		"Concurrency: " << plan.concurrency << std::endl);

	if(!activeUpload->session.isMultipart() )
		return runSingleShot(*activeUpload, options.progressCallback);

	initiateMultipart(*activeUpload);
	changeSessionStatus(*activeUpload, SessionStatus_INPROGRESS);

	return runMultipart(*activeUpload, options.progressCallback);
}

/**
 * Resume an interrupted or failed upload by its session ID. Parts that the backend already has are
 * not uploaded again.
 *
 * @return result with status Completed or Aborted; a completed session returns its result
 * 		without network calls.
 * @throw UploadException with type UploadErr_NOTFOUND if no session record exists,
 * 		UploadErr_INVALIDSTATE for aborted sessions, UploadErr_SESSIONCORRUPTION if local record
 * 		and remote state disagree; other types as for upload().
 */
UploadResult UploadOrchestrator::resume(const std::string& sessionID,
	ProgressCallback progressCallback)
{
	ActiveUploadPtr activeUpload = registerActiveUpload(sessionID);
	ActiveUploadGuard activeUploadGuard(*this, sessionID);

	bool sessionFound;

	{
		std::unique_lock<std::mutex> lock(
			activeUpload->workerManager.getSessionMutex() ); // L O C K (scoped)

		sessionFound = sessionStore.loadSession(sessionID, activeUpload->session);
	}

	if(!sessionFound)
		throw UploadException(UploadErr_NOTFOUND, "No session record found.", sessionID);

	return resumeLoaded(*activeUpload, progressCallback);
}

/**
 * Resume an upload by local path and remote key. If the local session record was lost, the
 * session is recovered from the most recent in-progress multipart upload of the object on the
 * backend.
 *
 * @localPath replaces the path of an existing session record, e.g. if the file was moved.
 * @throw UploadException with type UploadErr_NOTFOUND if there is neither a local session record
 * 		nor an in-progress multipart upload on the backend; other types as for resume(sessionID).
 */
UploadResult UploadOrchestrator::resume(const std::string& localPath, BucketRole bucketRole,
	const std::string& objectKey, ProgressCallback progressCallback)
{
	const std::string& bucketName = config.getBucketName(bucketRole);
	const std::string sessionID = UploadSession::makeSessionID(bucketName, objectKey);

	ActiveUploadPtr activeUpload = registerActiveUpload(sessionID);
	ActiveUploadGuard activeUploadGuard(*this, sessionID);

	bool sessionFound;

	{
		std::unique_lock<std::mutex> lock(
			activeUpload->workerManager.getSessionMutex() ); // L O C K (scoped)

		sessionFound = sessionStore.loadSession(sessionID, activeUpload->session);

		if(sessionFound && (activeUpload->session.localPath != localPath) )
		{
			LOGGER(Log_VERBOSE, "Updating local path of session. "
				"SessionID: " << sessionID << "; "
				"OldPath: " << activeUpload->session.localPath << "; "
				"NewPath: " << localPath << std::endl);

			activeUpload->session.localPath = localPath;
		}
	}

	if(!sessionFound)
		recoverSessionFromRemote(*activeUpload, localPath, bucketRole, bucketName, objectKey);

	return resumeLoaded(*activeUpload, progressCallback);
}

/**
 * Abort an upload. A running upload gets cooperatively cancelled (in-flight parts finish, no new
 * parts get claimed) and this call waits until it has stopped. The remote multipart upload gets
 * aborted and the session is marked as Aborted.
 *
 * Aborting a completed or aborted session is a no-op. For a failed session only the remote
 * multipart upload gets aborted, the session stays Failed.
 *
 * Note: Must not be called from within a progress callback of the same upload, because this waits
 * for the upload to finish.
 *
 * @throw UploadException with type UploadErr_NOTFOUND if no session record exists.
 */
void UploadOrchestrator::abort(const std::string& sessionID)
{
	ActiveUploadPtr activeUpload;

	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

		ActiveUploadMap::iterator iter = activeUploads.find(sessionID);

		if(iter != activeUploads.end() )
		{ // upload is running in this process => let it do the abort
			ActiveUploadPtr runningUpload = iter->second;

			LOGGER(Log_VERBOSE, "Requesting abort of running upload. "
				"SessionID: " << sessionID << std::endl);

			runningUpload->isAbortRequested = true;
			runningUpload->workerManager.interruptAndNotifyWorkers(true);
			condition.notify_all();

			condition.wait(lock,
				[&, this]
				{
					ActiveUploadMap::iterator waitIter = activeUploads.find(sessionID);
					return (waitIter == activeUploads.end() ) ||
						(waitIter->second != runningUpload);
				} );

			return;
		}

		activeUpload = registerActiveUploadUnlocked(sessionID);
	}

	ActiveUploadGuard activeUploadGuard(*this, sessionID);

	UploadSession& session = activeUpload->session;
	bool sessionFound;

	{
		std::unique_lock<std::mutex> lock(
			activeUpload->workerManager.getSessionMutex() ); // L O C K (scoped)

		sessionFound = sessionStore.loadSession(sessionID, session);
	}

	if(!sessionFound)
		throw UploadException(UploadErr_NOTFOUND, "No session record found.", sessionID);

	if(session.status == SessionStatus_FAILED)
	{
		if(!session.uploadID.empty() )
			abortRemoteUpload(session);

		return;
	}

	if(session.isTerminal() )
	{
		LOGGER(Log_VERBOSE, "Session is already finished, nothing to abort. "
			"SessionID: " << sessionID << "; "
			"Status: " << TranslatorTk::sessionStatusToStr(session.status) << std::endl);
		return;
	}

	finishAborted(*activeUpload);
}

/**
 * @return true if an upload, resume or abort of the session is running in this process.
 */
bool UploadOrchestrator::isUploadActive(const std::string& sessionID)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	return (activeUploads.find(sessionID) != activeUploads.end() );
}

/**
 * Get progress of a session, computed from the current part states. For uploads running in this
 * process the values are live, otherwise they come from the session record.
 *
 * @throw UploadException with type UploadErr_NOTFOUND if no session record exists.
 */
void UploadOrchestrator::getProgress(const std::string& sessionID,
	ProgressSnapshot& outSnapshot)
{
	ActiveUploadPtr activeUpload;

	{
		std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

		ActiveUploadMap::iterator iter = activeUploads.find(sessionID);

		if(iter != activeUploads.end() )
			activeUpload = iter->second;
	}

	if(activeUpload)
	{
		std::unique_lock<std::mutex> lock(
			activeUpload->workerManager.getSessionMutex() ); // L O C K (scoped)

		if(activeUpload->session.sessionID == sessionID)
		{
			activeUpload->session.computeProgress(outSnapshot);
			return;
		}

		// session not loaded yet => fall through to session record
	}

	UploadSession session;

	if(!sessionStore.loadSession(sessionID, session) )
		throw UploadException(UploadErr_NOTFOUND, "No session record found.", sessionID);

	session.computeProgress(outSnapshot);
}

/**
 * Get sessions of the given bucket role that have not been completed or aborted, i.e. that are
 * running or can be resumed.
 */
void UploadOrchestrator::listActiveSessions(BucketRole bucketRole,
	UploadSessionVec& outSessions)
{
	UploadSessionVec allSessions;

	sessionStore.listSessions(allSessions);

	for(const UploadSession& session : allSessions)
	{
		if(session.bucketRole != bucketRole)
			continue;

		if( (session.status == SessionStatus_COMPLETED) ||
			(session.status == SessionStatus_ABORTED) )
			continue;

		outSessions.push_back(session);
	}
}

/**
 * Get in-progress multipart uploads on the backend, independent of local session records.
 *
 * @throw UploadException on backend error.
 */
void UploadOrchestrator::listRemoteUploads(BucketRole bucketRole, const std::string& keyPrefix,
	RemoteUploadVec& outUploads)
{
	const std::string& bucketName = config.getBucketName(bucketRole);

	try
	{
		storageClient->listInProgressUploads(bucketName, keyPrefix, outUploads);
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what() );
	}
}

/**
 * @return false if the object does not exist.
 * @throw UploadException on backend error.
 */
bool UploadOrchestrator::getObjectInfo(BucketRole bucketRole, const std::string& objectKey,
	ObjectInfo& outInfo)
{
	const std::string& bucketName = config.getBucketName(bucketRole);

	try
	{
		return storageClient->headObject(bucketName, objectKey, outInfo);
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what() );
	}
}

/**
 * @return presigned GET URL of the object, valid for ttlSecs.
 * @throw UploadException on error.
 */
std::string UploadOrchestrator::presignURL(BucketRole bucketRole, const std::string& objectKey,
	unsigned ttlSecs)
{
	const std::string& bucketName = config.getBucketName(bucketRole);

	if(!ttlSecs)
		throw UploadException(UploadErr_INVALIDSTATE, "Presigned URL lifetime may not be zero.");

	try
	{
		return storageClient->presignURL(bucketName, objectKey, ttlSecs);
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what() );
	}
}

/**
 * Delete session records that have not been updated within the retention window. The remote
 * multipart upload of expired sessions that were not completed or aborted gets aborted.
 * Sessions that are running in this process are skipped.
 *
 * @return number of deleted session records.
 */
size_t UploadOrchestrator::purgeExpiredSessions()
{
	UploadSessionVec sessions;

	sessionStore.listSessions(sessions);

	const time_t now = time(NULL);
	size_t numPurged = 0;

	for(const UploadSession& session : sessions)
	{
		if( (session.updatedAt < now) &&
			( (uint64_t)(now - session.updatedAt) > config.sessionRetentionSecs) )
		{
			ActiveUploadPtr activeUpload;

			{
				std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

				if(activeUploads.count(session.sessionID) )
				{
					LOGGER(Log_DEBUG, "Skipping expired session that is currently active. "
						"SessionID: " << session.sessionID << std::endl);
					continue;
				}

				activeUpload = registerActiveUploadUnlocked(session.sessionID);
			}

			ActiveUploadGuard activeUploadGuard(*this, session.sessionID);

			if( (session.status != SessionStatus_COMPLETED) &&
				(session.status != SessionStatus_ABORTED) && !session.uploadID.empty() )
				abortRemoteUpload(session);

			sessionStore.deleteSession(session.sessionID);

			LOGGER(Log_VERBOSE, "Purged expired session. "
				"SessionID: " << session.sessionID << "; "
				"Key: " << session.objectKey << "; "
				"Status: " << TranslatorTk::sessionStatusToStr(session.status) << "; "
				"LastUpdate: " << StringTk::timeToStr(session.updatedAt) << std::endl);

			numPurged++;
		}
	}

	return numPurged;
}

/**
 * @throw ProgException if no bucket is configured for bucketRole.
 */
std::string UploadOrchestrator::getSessionID(BucketRole bucketRole,
	const std::string& objectKey) const
{
	return UploadSession::makeSessionID(config.getBucketName(bucketRole), objectKey);
}

/**
 * Check config and return its session dir, for use in the constructor initializer list.
 *
 * @throw ProgException on invalid config.
 */
const std::string& UploadOrchestrator::getCheckedSessionDir(const UploadConfig& config)
{
	config.checkConfig();

	return config.sessionDir;
}

/**
 * @throw UploadException with type UploadErr_INVALIDSTATE if the session is already active in this
 * 		process.
 */
UploadOrchestrator::ActiveUploadPtr UploadOrchestrator::registerActiveUpload(
	const std::string& sessionID)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	return registerActiveUploadUnlocked(sessionID);
}

/**
 * Caller must hold mutex.
 *
 * @throw UploadException with type UploadErr_INVALIDSTATE if the session is already active in this
 * 		process.
 */
UploadOrchestrator::ActiveUploadPtr UploadOrchestrator::registerActiveUploadUnlocked(
	const std::string& sessionID)
{
	if(activeUploads.count(sessionID) )
		throw UploadException(UploadErr_INVALIDSTATE, "Session is already active in this process.",
			sessionID);

	ActiveUploadPtr activeUpload = std::make_shared<ActiveUpload>(
		config, *storageClient, sessionStore);

	activeUploads[sessionID] = activeUpload;

	return activeUpload;
}

void UploadOrchestrator::unregisterActiveUpload(const std::string& sessionID)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	activeUploads.erase(sessionID);

	condition.notify_all();
}

bool UploadOrchestrator::isAbortRequested(ActiveUpload& activeUpload)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	return activeUpload.isAbortRequested;
}

/**
 * Remove a left-over session record of a previous process before a fresh upload of the same
 * object. Its remote multipart upload gets aborted if it might still be alive.
 */
void UploadOrchestrator::replaceStaleSession(const std::string& sessionID)
{
	UploadSession oldSession;
	bool sessionFound;

	try
	{
		sessionFound = sessionStore.loadSession(sessionID, oldSession);
	}
	catch(UploadException& e)
	{
		if(e.getErrorType() != UploadErr_SESSIONCORRUPTION)
			throw;

		ERRLOGGER(Log_VERBOSE, "Replacing unreadable session record. " << e.what() << std::endl);

		sessionStore.deleteSession(sessionID);
		return;
	}

	if(!sessionFound)
		return;

	LOGGER(Log_VERBOSE, "Replacing previous session record. "
		"SessionID: " << sessionID << "; "
		"Status: " << TranslatorTk::sessionStatusToStr(oldSession.status) << std::endl);

	if( (oldSession.status != SessionStatus_COMPLETED) &&
		(oldSession.status != SessionStatus_ABORTED) && !oldSession.uploadID.empty() )
		abortRemoteUpload(oldSession);

	sessionStore.deleteSession(sessionID);
}

/**
 * Parts that were uploading or failed when the previous process stopped are pending again.
 */
void UploadOrchestrator::resetStaleParts(ActiveUpload& activeUpload)
{
	std::unique_lock<std::mutex> lock(
		activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

	for(PartRecord& part : activeUpload.session.parts)
	{
		if( (part.status == PartStatus_UPLOADING) || (part.status == PartStatus_FAILED) )
			part.status = PartStatus_PENDING;
	}
}

/**
 * Continue a loaded session: reconcile with the backend and upload the missing parts.
 */
UploadResult UploadOrchestrator::resumeLoaded(ActiveUpload& activeUpload,
	ProgressCallback progressCallback)
{
	UploadSession& session = activeUpload.session;

	switch(session.status)
	{
		case SessionStatus_COMPLETED:
		{
			LOGGER(Log_VERBOSE, "Session is already completed. "
				"SessionID: " << session.sessionID << std::endl);

			UploadResult result;
			result.sessionID = session.sessionID;
			result.status = SessionStatus_COMPLETED;
			result.object = makeObjectDescriptor(session);

			return result;
		} break;

		case SessionStatus_ABORTED:
		{
			throw UploadException(UploadErr_INVALIDSTATE, "Session has been aborted. A fresh "
				"upload is required.", session.sessionID);
		} break;

		case SessionStatus_FAILED:
		{ // terminal, so a new record with the same identity, plan and upload ID replaces it
			if(session.failureType ==
				TranslatorTk::uploadErrorTypeToStr(UploadErr_SESSIONCORRUPTION) )
				throw UploadException(UploadErr_SESSIONCORRUPTION, "Session failed because local "
					"and remote state disagree. A fresh upload is required.", session.sessionID);

			std::unique_lock<std::mutex> lock(
				activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

			LOGGER(Log_VERBOSE, "Replacing failed session record for resume. "
				"SessionID: " << session.sessionID << "; "
				"Failure: " << session.failureType << std::endl);

			session.status = SessionStatus_PENDING;
			session.failureType.clear();
			session.createdAt = time(NULL);
			session.updatedAt = session.createdAt;

			sessionStore.saveSession(session);
		} break;

		default:
			break;
	}

	uint64_t fileSize;

	try
	{
		fileSize = FileTk::getFileSize(session.localPath);
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, e.what(), session.sessionID);
	}

	if(fileSize != session.totalSize)
		throw makeCorruptionException(activeUpload, "Local file size changed since the session "
			"was created. "
			"Path: " + session.localPath + "; "
			"SessionSize: " + std::to_string(session.totalSize) + "; "
			"FileSize: " + std::to_string(fileSize) );

	if(!session.isMultipart() )
		return runSingleShot(activeUpload, progressCallback);

	try
	{
		session.checkPartsCoverage();
	}
	catch(UploadException& e)
	{
		markSessionFailed(activeUpload, e);
		throw;
	}

	resetStaleParts(activeUpload);

	if(session.uploadID.empty() )
		initiateMultipart(activeUpload); // previous process stopped before initiation
	else
		reconcileWithRemote(activeUpload);

	if(session.status == SessionStatus_PENDING)
		changeSessionStatus(activeUpload, SessionStatus_INPROGRESS);

	return runMultipart(activeUpload, progressCallback);
}

/**
 * Create a new session record from the most recent in-progress multipart upload of the object on
 * the backend. The chunk size is taken from the first remote part, if there is one.
 *
 * @throw UploadException with type UploadErr_NOTFOUND if the backend has no in-progress upload
 * 		for the object.
 */
void UploadOrchestrator::recoverSessionFromRemote(ActiveUpload& activeUpload,
	const std::string& localPath, BucketRole bucketRole, const std::string& bucketName,
	const std::string& objectKey)
{
	const std::string sessionID = UploadSession::makeSessionID(bucketName, objectKey);

	RemoteUploadVec remoteUploads;
	RemotePartVec remoteParts;

	try
	{
		storageClient->listInProgressUploads(bucketName, objectKey, remoteUploads);
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(), sessionID);
	}

	const RemoteUpload* latestUpload = NULL;

	for(const RemoteUpload& remoteUpload : remoteUploads)
	{
		if(remoteUpload.objectKey != objectKey)
			continue; // prefix match only

		if(!latestUpload || (remoteUpload.initiated > latestUpload->initiated) )
			latestUpload = &remoteUpload;
	}

	if(!latestUpload)
		throw UploadException(UploadErr_NOTFOUND, "Neither a session record nor an in-progress "
			"multipart upload exists for the object. "
			"Bucket: " + bucketName + "; "
			"Key: " + objectKey, sessionID);

	uint64_t totalSize;

	try
	{
		totalSize = FileTk::getFileSize(localPath);
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, e.what(), sessionID);
	}

	try
	{
		storageClient->listParts(bucketName, objectKey, latestUpload->uploadID, remoteParts);
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(), sessionID);
	}

	uint64_t chunkSizeOverride = 0;

	for(const RemotePart& remotePart : remoteParts)
	{
		if( (remotePart.partNumber == 1) && (remotePart.size < totalSize) )
			chunkSizeOverride = remotePart.size;
	}

	PartPlan plan;
	partPlanner.plan(totalSize, chunkSizeOverride, 0, plan);

	if(plan.parts.empty() )
		throw UploadException(UploadErr_SESSIONCORRUPTION, "Local file is below the multipart "
			"threshold, but the backend has an in-progress multipart upload for the object. "
			"Path: " + localPath + "; "
			"FileSize: " + std::to_string(totalSize), sessionID);

	std::unique_lock<std::mutex> lock(
		activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

	UploadSession& session = activeUpload.session;

	session.sessionID = sessionID;
	session.localPath = localPath;
	session.bucketRole = bucketRole;
	session.bucketName = bucketName;
	session.objectKey = objectKey;
	session.totalSize = totalSize;
	session.chunkSize = plan.chunkSize;
	session.concurrency = plan.concurrency;
	session.uploadID = latestUpload->uploadID;
	session.status = SessionStatus_PENDING;
	session.attribs.contentType = FileTk::getContentTypeByExtension(localPath);
	session.parts = plan.parts;
	session.createdAt = time(NULL);
	session.updatedAt = session.createdAt;

	sessionStore.createSession(session);

	LOGGER(Log_VERBOSE, "Recovered session from in-progress multipart upload. "
		"SessionID: " << sessionID << "; "
		"UploadID: " << session.uploadID << "; "
		"RemoteParts: " << remoteParts.size() << "; "
		"ChunkSize: " << session.chunkSize << std::endl);
}

/**
 * Mark parts that the backend already has as uploaded. A remote part outside of the local plan, a
 * remote part with a different length or a locally uploaded part that the backend doesn't know
 * means the session can't be trusted anymore.
 *
 * @throw UploadException with type UploadErr_SESSIONCORRUPTION in the cases above, which leaves
 * 		the session Failed.
 */
void UploadOrchestrator::reconcileWithRemote(ActiveUpload& activeUpload)
{
	UploadSession& session = activeUpload.session;
	RemotePartVec remoteParts;

	try
	{
		LOGGER(Log_DEBUG, "Listing remote parts. "
			"Bucket: " << session.bucketName << "; "
			"Key: " << session.objectKey << "; "
			"UploadID: " << session.uploadID << std::endl);

		storageClient->listParts(session.bucketName, session.objectKey, session.uploadID,
			remoteParts);
	}
	catch(StorageNotFoundException& e)
	{
		throw makeCorruptionException(activeUpload, std::string("Remote multipart upload does "
			"not exist anymore. ") +
			"UploadID: " + session.uploadID + "; "
			"Error: " + e.what() );
	}
	catch(StorageException& e)
	{
		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(),
			session.sessionID);
	}

	std::string errorMessage; // set on mismatch
	unsigned errorPartNumber = 0;
	size_t numConfirmedParts = 0;

	{
		std::unique_lock<std::mutex> lock(
			activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

		std::set<unsigned> remotePartNumbers;

		for(const RemotePart& remotePart : remoteParts)
		{
			remotePartNumbers.insert(remotePart.partNumber);

			PartRecord* part = session.getPart(remotePart.partNumber);

			if(!part)
			{
				errorMessage = "Remote part is outside of the local part plan. "
					"NumPlannedParts: " + std::to_string(session.parts.size() );
				errorPartNumber = remotePart.partNumber;
				break;
			}

			if(remotePart.size != part->length)
			{
				errorMessage = "Remote part length doesn't match planned length. "
					"RemoteLength: " + std::to_string(remotePart.size) + "; "
					"PlannedLength: " + std::to_string(part->length);
				errorPartNumber = remotePart.partNumber;
				break;
			}

			if(part->status != PartStatus_UPLOADED)
			{
				part->status = PartStatus_UPLOADED;
				part->eTag = remotePart.eTag;
				numConfirmedParts++;
			}
		}

		if(errorMessage.empty() )
		{
			for(const PartRecord& part : session.parts)
			{
				if( (part.status == PartStatus_UPLOADED) &&
					!remotePartNumbers.count(part.partNumber) )
				{
					errorMessage = "Part recorded as uploaded is unknown to the backend.";
					errorPartNumber = part.partNumber;
					break;
				}
			}
		}

		if(errorMessage.empty() )
		{
			session.touch();
			sessionStore.saveSession(session);
		}
	}

	if(!errorMessage.empty() )
		throw makeCorruptionException(activeUpload, errorMessage, errorPartNumber);

	LOGGER(Log_VERBOSE, "Reconciled session with backend. "
		"SessionID: " << session.sessionID << "; "
		"RemoteParts: " << remoteParts.size() << "; "
		"NewlyConfirmed: " << numConfirmedParts << std::endl);
}

/**
 * Start the multipart upload on the backend and persist its upload ID.
 *
 * @throw UploadException on backend error, which leaves the session Failed.
 */
void UploadOrchestrator::initiateMultipart(ActiveUpload& activeUpload)
{
	UploadSession& session = activeUpload.session;
	std::string uploadID;

	try
	{
		LOGGER(Log_DEBUG, "Initiating multipart upload. "
			"Bucket: " << session.bucketName << "; "
			"Key: " << session.objectKey << std::endl);

		uploadID = storageClient->initiateMultipart(session.bucketName, session.objectKey,
			session.attribs);
	}
	catch(StorageException& e)
	{
		markSessionFailed(activeUpload, e);

		throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(),
			session.sessionID);
	}

	std::unique_lock<std::mutex> lock(
		activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

	session.uploadID = uploadID;
	session.touch();

	sessionStore.saveSession(session);
}

/**
 * Upload the whole file with a single put request. Transient errors are retried with the same
 * backoff as parts.
 */
UploadResult UploadOrchestrator::runSingleShot(ActiveUpload& activeUpload,
	ProgressCallback progressCallback)
{
	UploadSession& session = activeUpload.session;
	ProgressAggregator progressAggregator(session.totalSize, progressCallback,
		config.progressIntervalMS);

	for(unsigned numAttemptsDone = 0; ; )
	{
		if(isAbortRequested(activeUpload) )
			return finishAborted(activeUpload);

		try
		{
			numAttemptsDone++;

			LOGGER(Log_DEBUG, "Uploading object. "
				"Bucket: " << session.bucketName << "; "
				"Key: " << session.objectKey << "; "
				"Size: " << session.totalSize << "; "
				"Attempt: " << numAttemptsDone << std::endl);

			ObjectDescriptor object = storageClient->putObject(session.bucketName,
				session.objectKey, session.localPath, session.totalSize, session.attribs);

			progressAggregator.addCompletedBytes(session.totalSize);
			progressAggregator.notifyFinished();

			return finishCompleted(activeUpload, object);
		}
		catch(StorageTransientException& e)
		{
			if(numAttemptsDone >= config.maxPartAttempts)
			{
				markSessionFailed(activeUpload, e);

				throw UploadException(UploadErr_TRANSIENTEXHAUSTED, e.what(), session.sessionID);
			}

			LOGGER(Log_VERBOSE, "Retrying object upload after transient error. "
				"Attempt: " << numAttemptsDone << "; "
				"Error: " << e.what() << std::endl);

			if(!waitRetryBackoff(activeUpload, numAttemptsDone) )
				return finishAborted(activeUpload);
		}
		catch(StorageException& e)
		{
			markSessionFailed(activeUpload, e);

			throw UploadException(TranslatorTk::exceptionToUploadErrorType(e), e.what(),
				session.sessionID);
		}
		catch(UploadException& e)
		{
			markSessionFailed(activeUpload, e);
			throw;
		}
		catch(ProgException& e)
		{ // local source file error
			markSessionFailed(activeUpload, e);

			throw UploadException(UploadErr_LOCALIO, e.what(), session.sessionID);
		}
	}
}

/**
 * Upload pending parts through the worker pool and complete the multipart upload.
 */
UploadResult UploadOrchestrator::runMultipart(ActiveUpload& activeUpload,
	ProgressCallback progressCallback)
{
	UploadSession& session = activeUpload.session;
	ProgressAggregator progressAggregator(session.totalSize, progressCallback,
		config.progressIntervalMS);

	ProgressSnapshot snapshot;
	session.computeProgress(snapshot);
	progressAggregator.setInitialBytes(snapshot.numBytesDone);

	if(isAbortRequested(activeUpload) )
		return finishAborted(activeUpload);

	PoolResult poolResult;

	try
	{
		poolResult = activeUpload.workerManager.runPool(session, progressAggregator);
	}
	catch(UploadException& e)
	{ // remote upload stays alive for resume
		markSessionFailed(activeUpload, e);
		throw;
	}

	if( (poolResult == PoolResult_ABORTED) || isAbortRequested(activeUpload) )
		return finishAborted(activeUpload);

	ObjectDescriptor object;

	if(!completeWithRetries(activeUpload, object) )
		return finishAborted(activeUpload);

	progressAggregator.notifyFinished();

	return finishCompleted(activeUpload, object);
}

/**
 * Send the completion request with ETags ordered by part number. A rejected completion is retried
 * on its own (not the whole upload). When retries are exhausted, the remote upload gets aborted and
 * the session is marked Failed.
 *
 * @return false if an abort was requested during retry backoff.
 * @throw UploadException when retries are exhausted.
 */
bool UploadOrchestrator::completeWithRetries(ActiveUpload& activeUpload,
	ObjectDescriptor& outObject)
{
	UploadSession& session = activeUpload.session;
	PartETagVec partETags;

	try
	{
		session.getOrderedPartETags(partETags);
	}
	catch(UploadException& e)
	{
		markSessionFailed(activeUpload, e);
		throw;
	}

	for(unsigned numAttemptsDone = 0; ; )
	{
		try
		{
			numAttemptsDone++;

			LOGGER(Log_DEBUG, "Completing multipart upload. "
				"Bucket: " << session.bucketName << "; "
				"Key: " << session.objectKey << "; "
				"UploadID: " << session.uploadID << "; "
				"NumParts: " << partETags.size() << "; "
				"Attempt: " << numAttemptsDone << std::endl);

			outObject = storageClient->completeMultipart(session.bucketName, session.objectKey,
				session.uploadID, partETags);

			return true;
		}
		catch(StorageException& e)
		{
			if(numAttemptsDone > config.numCompletionRetries)
			{
				abortRemoteUpload(session);
				markSessionFailed(activeUpload, e);

				throw UploadException(TranslatorTk::exceptionToUploadErrorType(e),
					std::string("Multipart upload completion failed. ") + e.what(),
					session.sessionID);
			}

			LOGGER(Log_VERBOSE, "Retrying multipart upload completion. "
				"SessionID: " << session.sessionID << "; "
				"Attempt: " << numAttemptsDone << "; "
				"Error: " << e.what() << std::endl);

			if(!waitRetryBackoff(activeUpload, numAttemptsDone) )
				return false;
		}
	}
}

/**
 * Abort the remote multipart upload (if any) and mark the session Aborted.
 */
UploadResult UploadOrchestrator::finishAborted(ActiveUpload& activeUpload)
{
	UploadSession& session = activeUpload.session;

	if(!session.uploadID.empty() )
		abortRemoteUpload(session);

	changeSessionStatus(activeUpload, SessionStatus_ABORTED);

	LOGGER(Log_VERBOSE, "Upload aborted. "
		"SessionID: " << session.sessionID << "; "
		"Key: " << session.objectKey << std::endl);

	UploadResult result;
	result.sessionID = session.sessionID;
	result.status = SessionStatus_ABORTED;

	return result;
}

UploadResult UploadOrchestrator::finishCompleted(ActiveUpload& activeUpload,
	const ObjectDescriptor& object)
{
	UploadSession& session = activeUpload.session;

	{
		std::unique_lock<std::mutex> lock(
			activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

		session.objectETag = object.eTag;
	}

	changeSessionStatus(activeUpload, SessionStatus_COMPLETED);

	UploadResult result;
	result.sessionID = session.sessionID;
	result.status = SessionStatus_COMPLETED;
	result.object = makeObjectDescriptor(session);

	LOGGER(Log_VERBOSE, "Upload completed. "
		"SessionID: " << session.sessionID << "; "
		"URL: " << result.object.url << std::endl);

	return result;
}

/**
 * Change status of the session and persist it.
 *
 * @throw UploadException if the transition is invalid or the session can't be saved.
 */
void UploadOrchestrator::changeSessionStatus(ActiveUpload& activeUpload,
	SessionStatus newStatus)
{
	std::unique_lock<std::mutex> lock(
		activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

	UploadSession& session = activeUpload.session;

	const SessionStatus oldStatus = session.status;

	session.setStatus(newStatus);

	sessionStore.saveSession(session);

	LOGGER(Log_VERBOSE, "Session status change. "
		"SessionID: " << session.sessionID << "; "
		"Old: " << TranslatorTk::sessionStatusToStr(oldStatus) << "; "
		"New: " << TranslatorTk::sessionStatusToStr(newStatus) << std::endl);
}

/**
 * Mark the session Failed after a fatal error. A failing save is only logged, because the
 * original error is what gets reported to the caller.
 */
void UploadOrchestrator::markSessionFailed(ActiveUpload& activeUpload,
	const std::exception& error)
{
	std::unique_lock<std::mutex> lock(
		activeUpload.workerManager.getSessionMutex() ); // L O C K (scoped)

	UploadSession& session = activeUpload.session;

	if(session.isTerminal() )
		return;

	LOGGER(Log_VERBOSE, "Marking session as failed. "
		"SessionID: " << session.sessionID << "; "
		"Error: " << error.what() << std::endl);

	session.setStatus(SessionStatus_FAILED);
	session.failureType = TranslatorTk::uploadErrorTypeToStr(
		TranslatorTk::exceptionToUploadErrorType(error) );

	try
	{
		sessionStore.saveSession(session);
	}
	catch(ProgException& e)
	{
		ERRLOGGER(Log_NORMAL, "Unable to persist failed session state. " << e.what() << std::endl);
	}
}

/**
 * Best-effort abort of the remote multipart upload of a session. Errors are logged, not thrown.
 */
void UploadOrchestrator::abortRemoteUpload(const UploadSession& session)
{
	try
	{
		LOGGER(Log_DEBUG, "Aborting multipart upload. "
			"Bucket: " << session.bucketName << "; "
			"Key: " << session.objectKey << "; "
			"UploadID: " << session.uploadID << std::endl);

		storageClient->abortMultipart(session.bucketName, session.objectKey, session.uploadID);
	}
	catch(StorageException& e)
	{
		ERRLOGGER(Log_NORMAL, "Unable to abort remote multipart upload. "
			"SessionID: " << session.sessionID << "; "
			"UploadID: " << session.uploadID << "; "
			"Error: " << e.what() << std::endl);
	}
}

/**
 * Sleep for the backoff time of the given attempt or until an abort gets requested.
 *
 * @return false if an abort was requested.
 */
bool UploadOrchestrator::waitRetryBackoff(ActiveUpload& activeUpload, unsigned numAttemptsDone)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	bool isAborted = condition.wait_for(lock,
		std::chrono::milliseconds(config.getRetryDelayMS(numAttemptsDone) ),
		[&] { return activeUpload.isAbortRequested; } );

	return !isAborted;
}

ObjectDescriptor UploadOrchestrator::makeObjectDescriptor(const UploadSession& session) const
{
	ObjectDescriptor object;

	object.bucketName = session.bucketName;
	object.objectKey = session.objectKey;
	object.eTag = session.objectETag;
	object.size = session.totalSize;
	object.url = StringTk::makeObjectURL(config.endpointURL, session.bucketName,
		session.objectKey);

	return object;
}

/**
 * Create a corruption error for the caller to throw and mark the session Failed, so that a fresh
 * upload is required.
 */
UploadException UploadOrchestrator::makeCorruptionException(ActiveUpload& activeUpload,
	const std::string& errorMessage, unsigned partNumber)
{
	UploadException corruptionException(UploadErr_SESSIONCORRUPTION, errorMessage,
		activeUpload.session.sessionID, partNumber);

	markSessionFailed(activeUpload, corruptionException);

	return corruptionException;
}
