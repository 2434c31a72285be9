// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef SESSIONSTORE_H_
#define SESSIONSTORE_H_

#include <mutex>
#include <string>
#include "UploadSession.h"

#define SESSIONSTORE_FILE_SUFFIX		".json"


/**
 * Durable store of upload sessions: one JSON file per session in the configured directory, named
 * after the session ID. Files are replaced atomically, so a crash leaves either the old or the new
 * record.
 *
 * Thread-safe. Worker threads save part status transitions concurrently.
 */
class SessionStore
{
	public:
		explicit SessionStore(const std::string& sessionDir);

		void createSession(const UploadSession& session);
		void saveSession(const UploadSession& session);
		bool loadSession(const std::string& sessionID, UploadSession& outSession);
		void deleteSession(const std::string& sessionID);
		void listSessions(UploadSessionVec& outSessions);

	private:
		std::mutex mutex; // serializes file access of this store
		std::string sessionDir;

		std::string getSessionPath(const std::string& sessionID) const;
		void writeSessionUnlocked(const UploadSession& session);
		bool readSessionUnlocked(const std::string& sessionID, UploadSession& outSession);
};


#endif /* SESSIONSTORE_H_ */
