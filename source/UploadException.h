// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef UPLOADEXCEPTION_H_
#define UPLOADEXCEPTION_H_

#include "ProgException.h"


/**
 * Classification of errors that reach the caller of UploadOrchestrator.
 */
enum UploadErrorType
{
	UploadErr_TRANSIENTEXHAUSTED = 0, // part retries exhausted on transient network errors
	UploadErr_AUTH, // credentials rejected by backend
	UploadErr_PARTSIZE, // backend rejected part size
	UploadErr_INVALIDPOLICY, // size policy would produce invalid parts (config error)
	UploadErr_SESSIONCORRUPTION, // local session record and remote state disagree
	UploadErr_QUOTA, // backend storage quota exceeded
	UploadErr_BACKEND, // any other backend rejection
	UploadErr_LOCALIO, // local source file or session store error
	UploadErr_NOTFOUND, // no session or remote upload for given identity
	UploadErr_INVALIDSTATE, // operation not allowed in current session state
};


/**
 * Error surfaced by UploadOrchestrator. Carries enough context (session ID and part number) for the
 * caller to decide between resume and manual intervention.
 */
class UploadException : public ProgException
{
	public:
		UploadException(UploadErrorType errorType, const std::string& errorMessage,
			const std::string& sessionID = "", unsigned partNumber = 0) :
			ProgException(makeMessage(errorMessage, sessionID, partNumber) ),
			errorType(errorType), sessionID(sessionID), partNumber(partNumber) {};

	private:
		UploadErrorType errorType;
		std::string sessionID; // empty if error occurred before session creation
		unsigned partNumber; // 0 if not related to a specific part

		static std::string makeMessage(const std::string& errorMessage,
			const std::string& sessionID, unsigned partNumber)
		{
			std::string msg(errorMessage);

			if(!sessionID.empty() )
				msg += " SessionID: " + sessionID + ";";

			if(partNumber)
				msg += " Part: " + std::to_string(partNumber) + ";";

			return msg;
		}

	// inliners
	public:
		UploadErrorType getErrorType() const { return errorType; }
		const std::string& getSessionID() const { return sessionID; }
		unsigned getPartNumber() const { return partNumber; }
};

#endif /* UPLOADEXCEPTION_H_ */
