// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef UPLOADORCHESTRATOR_H_
#define UPLOADORCHESTRATOR_H_

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include "PartPlanner.h"
#include "ProgressAggregator.h"
#include "SessionStore.h"
#include "storage/StorageClient.h"
#include "UploadConfig.h"
#include "UploadException.h"
#include "UploadSession.h"
#include "workers/WorkerManager.h"


/**
 * Caller options of a new upload.
 */
struct UploadOptions
{
	std::string objectKey; // empty for "YYYYmmdd_HHMMSS_<filename>"
	std::string contentType; // empty to derive from file extension
	StringMap metadata;
	uint64_t chunkSize{0}; // 0 to use size policy
	unsigned concurrency{0}; // 0 to use size policy
	ProgressCallback progressCallback; // may be empty
};

/**
 * Outcome of upload or resume. Errors are reported as UploadException, user abort is not an error.
 */
struct UploadResult
{
	std::string sessionID;
	SessionStatus status{SessionStatus_PENDING}; // Completed or Aborted
	ObjectDescriptor object; // only valid for Completed
};


/**
 * Facade of the upload core. Decides between single-shot and multipart upload, drives planning,
 * session persistence, the worker pool and completion, and implements resume and abort.
 *
 * Session status changes are serialized through this class. All public methods are thread-safe;
 * upload() and resume() block until the upload has finished, so abort() and getProgress() are
 * meant to be called from other threads.
 */
class UploadOrchestrator
{
	public:
		UploadOrchestrator(const UploadConfig& config,
			std::shared_ptr<StorageClient> storageClient);

		UploadResult upload(const std::string& localPath, BucketRole bucketRole,
			const UploadOptions& options);
		UploadResult resume(const std::string& sessionID,
			ProgressCallback progressCallback = ProgressCallback() );
		UploadResult resume(const std::string& localPath, BucketRole bucketRole,
			const std::string& objectKey,
			ProgressCallback progressCallback = ProgressCallback() );
		void abort(const std::string& sessionID);
		bool isUploadActive(const std::string& sessionID);
		void getProgress(const std::string& sessionID, ProgressSnapshot& outSnapshot);
		void listActiveSessions(BucketRole bucketRole, UploadSessionVec& outSessions);
		void listRemoteUploads(BucketRole bucketRole, const std::string& keyPrefix,
			RemoteUploadVec& outUploads);
		bool getObjectInfo(BucketRole bucketRole, const std::string& objectKey,
			ObjectInfo& outInfo);
		std::string presignURL(BucketRole bucketRole, const std::string& objectKey,
			unsigned ttlSecs = UPLOADCONFIG_PRESIGN_TTL_SECS);
		size_t purgeExpiredSessions();
		std::string getSessionID(BucketRole bucketRole, const std::string& objectKey) const;


	private:
		/**
		 * Upload that is running in this process (or an abort that is in progress for it).
		 */
		class ActiveUpload
		{
			public:
				ActiveUpload(const UploadConfig& config, StorageClient& storageClient,
					SessionStore& sessionStore) :
					workerManager(config, storageClient, sessionStore) {}

				UploadSession session; // protected by workerManager.getSessionMutex()
				WorkerManager workerManager;
				bool isAbortRequested{false}; // protected by orchestrator mutex
		};

		typedef std::shared_ptr<ActiveUpload> ActiveUploadPtr;
		typedef std::map<std::string, ActiveUploadPtr> ActiveUploadMap;

		/**
		 * Removes an upload from the active map when the registering operation returns.
		 */
		class ActiveUploadGuard
		{
			public:
				ActiveUploadGuard(UploadOrchestrator& orchestrator, const std::string& sessionID) :
					orchestrator(orchestrator), sessionID(sessionID) {}

				~ActiveUploadGuard()
				{
					orchestrator.unregisterActiveUpload(sessionID);
				}

			private:
				UploadOrchestrator& orchestrator;
				std::string sessionID;
		};

		const UploadConfig config;
		std::shared_ptr<StorageClient> storageClient;
		SessionStore sessionStore;
		PartPlanner partPlanner;

		std::mutex mutex; // protects activeUploads and isAbortRequested flags
		std::condition_variable condition; // signals unregistration and abort requests
		ActiveUploadMap activeUploads;

		static const std::string& getCheckedSessionDir(const UploadConfig& config);

		ActiveUploadPtr registerActiveUpload(const std::string& sessionID);
		ActiveUploadPtr registerActiveUploadUnlocked(const std::string& sessionID);
		void unregisterActiveUpload(const std::string& sessionID);
		bool isAbortRequested(ActiveUpload& activeUpload);

		void replaceStaleSession(const std::string& sessionID);
		void resetStaleParts(ActiveUpload& activeUpload);
		UploadResult resumeLoaded(ActiveUpload& activeUpload, ProgressCallback progressCallback);
		void recoverSessionFromRemote(ActiveUpload& activeUpload, const std::string& localPath,
			BucketRole bucketRole, const std::string& bucketName, const std::string& objectKey);
		void reconcileWithRemote(ActiveUpload& activeUpload);
		void initiateMultipart(ActiveUpload& activeUpload);
		UploadResult runSingleShot(ActiveUpload& activeUpload, ProgressCallback progressCallback);
		UploadResult runMultipart(ActiveUpload& activeUpload, ProgressCallback progressCallback);
		bool completeWithRetries(ActiveUpload& activeUpload, ObjectDescriptor& outObject);
		UploadResult finishAborted(ActiveUpload& activeUpload);
		UploadResult finishCompleted(ActiveUpload& activeUpload, const ObjectDescriptor& object);

		void changeSessionStatus(ActiveUpload& activeUpload, SessionStatus newStatus);
		void markSessionFailed(ActiveUpload& activeUpload, const std::exception& error);
		void abortRemoteUpload(const UploadSession& session);
		bool waitRetryBackoff(ActiveUpload& activeUpload, unsigned numAttemptsDone);
		ObjectDescriptor makeObjectDescriptor(const UploadSession& session) const;
		UploadException makeCorruptionException(ActiveUpload& activeUpload,
			const std::string& errorMessage, unsigned partNumber = 0);
};


#endif /* UPLOADORCHESTRATOR_H_ */
