// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/property_tree/json_parser.hpp>
#include <sstream>
#include "Logger.h"
#include "ProgException.h"
#include "SessionStore.h"
#include "toolkits/FileTk.h"
#include "UploadException.h"

#define SESSIONID_VALID_CHARS		"0123456789abcdefABCDEF-"


/**
 * @sessionDir created including parents if it doesn't exist yet.
 * @throw UploadException with type UploadErr_LOCALIO if dir can't be created.
 */
SessionStore::SessionStore(const std::string& sessionDir) :
	sessionDir(sessionDir)
{
	int mkdirRes = FileTk::mkdirBottomUp(sessionDir.c_str(), MKDIR_MODE);

	if(mkdirRes == -1)
		throw UploadException(UploadErr_LOCALIO, "Unable to create session store directory. "
			"Path: " + sessionDir + "; "
			"SysErr: " + strerror(errno) );
}

/**
 * Store a new session.
 *
 * @throw UploadException with type UploadErr_INVALIDSTATE if a record with the same session ID
 * 		already exists; UploadErr_LOCALIO on write error.
 */
void SessionStore::createSession(const UploadSession& session)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	const std::string sessionPath = getSessionPath(session.sessionID);

	struct stat statBuf;

	if(!stat(sessionPath.c_str(), &statBuf) )
		throw UploadException(UploadErr_INVALIDSTATE, "Session record already exists. "
			"Path: " + sessionPath, session.sessionID);

	writeSessionUnlocked(session);

	LOGGER(Log_DEBUG, "Created session record. "
		"SessionID: " << session.sessionID << "; "
		"Key: " << session.objectKey << std::endl);
}

/**
 * Persist current state of an existing or new session, replacing the old record.
 *
 * @throw UploadException with type UploadErr_LOCALIO on write error.
 */
void SessionStore::saveSession(const UploadSession& session)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	writeSessionUnlocked(session);
}

/**
 * @return false if no record exists for the given session ID.
 * @throw UploadException with type UploadErr_SESSIONCORRUPTION if the record can't be parsed;
 * 		UploadErr_NOTFOUND if sessionID is not a valid session ID.
 */
bool SessionStore::loadSession(const std::string& sessionID, UploadSession& outSession)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	return readSessionUnlocked(sessionID, outSession);
}

/**
 * Delete the record of the given session. Deleting a non-existing record is not an error.
 *
 * @throw UploadException with type UploadErr_LOCALIO on error.
 */
void SessionStore::deleteSession(const std::string& sessionID)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	const std::string sessionPath = getSessionPath(sessionID);

	int unlinkRes = unlink(sessionPath.c_str() );

	if( (unlinkRes == -1) && (errno != ENOENT) )
		throw UploadException(UploadErr_LOCALIO, "Unable to delete session record. "
			"Path: " + sessionPath + "; "
			"SysErr: " + strerror(errno), sessionID);

	LOGGER(Log_DEBUG, "Deleted session record. "
		"SessionID: " << sessionID << std::endl);
}

/**
 * Load all session records of this store. Records that can't be parsed are skipped with an error
 * message, so that one corrupt file doesn't hide all others.
 *
 * @throw UploadException with type UploadErr_LOCALIO if the store dir can't be read.
 */
void SessionStore::listSessions(UploadSessionVec& outSessions)
{
	std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

	StringVec fileNames;

	try
	{
		FileTk::listDirFiles(sessionDir, SESSIONSTORE_FILE_SUFFIX, fileNames);
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, e.what() );
	}

	for(const std::string& fileName : fileNames)
	{
		const std::string sessionID = fileName.substr(0,
			fileName.length() - strlen(SESSIONSTORE_FILE_SUFFIX) );

		if(sessionID.find_first_not_of(SESSIONID_VALID_CHARS) != std::string::npos)
			continue; // not one of our records

		try
		{
			UploadSession session;

			if(readSessionUnlocked(sessionID, session) )
				outSessions.push_back(session);
		}
		catch(UploadException& e)
		{
			ERRLOGGER(Log_NORMAL, "Skipping unreadable session record. " << e.what() << std::endl);
		}
	}
}

/**
 * @throw UploadException with type UploadErr_NOTFOUND if sessionID contains invalid chars, so that
 * 		user-given IDs can't point outside of the store dir.
 */
std::string SessionStore::getSessionPath(const std::string& sessionID) const
{
	if(sessionID.empty() ||
		(sessionID.find_first_not_of(SESSIONID_VALID_CHARS) != std::string::npos) )
		throw UploadException(UploadErr_NOTFOUND, "Invalid session ID: \"" + sessionID + "\"");

	return sessionDir + "/" + sessionID + SESSIONSTORE_FILE_SUFFIX;
}

/**
 * Caller must hold mutex.
 *
 * @throw UploadException with type UploadErr_LOCALIO on error.
 */
void SessionStore::writeSessionUnlocked(const UploadSession& session)
{
	const std::string sessionPath = getSessionPath(session.sessionID);

	std::ostringstream jsonStream;

	try
	{
		bpt::ptree tree;

		session.getAsPropertyTree(tree);

		bpt::write_json(jsonStream, tree, true);
	}
	catch(bpt::ptree_error& e)
	{
		throw UploadException(UploadErr_LOCALIO, std::string("Unable to serialize session. ") +
			"SysErr: " + e.what(), session.sessionID);
	}

	try
	{
		FileTk::writeFileAtomic(sessionPath, jsonStream.str() );
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, std::string("Unable to save session. ") +
			e.what(), session.sessionID);
	}
}

/**
 * Caller must hold mutex.
 *
 * @return false if no record exists for the given session ID.
 * @throw UploadException with type UploadErr_SESSIONCORRUPTION if record can't be parsed or
 * 		doesn't belong to the given session ID; UploadErr_LOCALIO on read error.
 */
bool SessionStore::readSessionUnlocked(const std::string& sessionID, UploadSession& outSession)
{
	const std::string sessionPath = getSessionPath(sessionID);

	struct stat statBuf;

	if(stat(sessionPath.c_str(), &statBuf) == -1)
	{
		if(errno == ENOENT)
			return false;

		throw UploadException(UploadErr_LOCALIO, "Unable to access session record. "
			"Path: " + sessionPath + "; "
			"SysErr: " + strerror(errno), sessionID);
	}

	std::string jsonStr;

	try
	{
		FileTk::readFile(sessionPath, jsonStr);
	}
	catch(ProgException& e)
	{
		throw UploadException(UploadErr_LOCALIO, e.what(), sessionID);
	}

	try
	{
		std::istringstream jsonStream(jsonStr);
		bpt::ptree tree;

		bpt::read_json(jsonStream, tree);

		outSession.setFromPropertyTree(tree);
	}
	catch(bpt::ptree_error& e)
	{
		throw UploadException(UploadErr_SESSIONCORRUPTION, std::string("Unable to parse session "
			"record. ") +
			"Path: " + sessionPath + "; "
			"Error: " + e.what(), sessionID);
	}
	catch(ProgException& e)
	{ // unknown enum strings
		throw UploadException(UploadErr_SESSIONCORRUPTION, std::string("Invalid session "
			"record. ") +
			"Path: " + sessionPath + "; "
			"Error: " + e.what(), sessionID);
	}

	if(outSession.sessionID != sessionID)
		throw UploadException(UploadErr_SESSIONCORRUPTION, "Session record contains a different "
			"session ID. "
			"Path: " + sessionPath + "; "
			"FoundID: " + outSession.sessionID, sessionID);

	return true;
}
