// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#define BOOST_TEST_MODULE SessionStoreTest

#include <boost/test/unit_test.hpp>
#include <fstream>
#include "SessionStore.h"
#include "TestDir.h"
#include "UploadException.h"


static UploadSession makeSession(const std::string& objectKey)
{
	UploadSession session;

	session.sessionID = UploadSession::makeSessionID("outputs-bucket", objectKey);
	session.localPath = "/data/" + objectKey;
	session.bucketRole = BucketRole_OUTPUTS;
	session.bucketName = "outputs-bucket";
	session.objectKey = objectKey;
	session.totalSize = 25;
	session.chunkSize = 10;
	session.concurrency = 2;
	session.uploadID = "upload-1";
	session.status = SessionStatus_INPROGRESS;
	session.attribs.contentType = "video/mp4";
	session.attribs.metadata["user.id"] = "42";
	session.attribs.metadata["source"] = "render farm";
	session.createdAt = 1700000000;
	session.updatedAt = 1700000100;

	for(unsigned i=0; i < 3; i++)
	{
		PartRecord part;
		part.partNumber = i + 1;
		part.offset = i * 10;
		part.length = (i == 2) ? 5 : 10;

		session.parts.push_back(part);
	}

	session.parts[0].status = PartStatus_UPLOADED;
	session.parts[0].eTag = "\"etag-1\"";
	session.parts[0].attemptCount = 2;
	session.parts[1].status = PartStatus_UPLOADING;
	session.parts[1].attemptCount = 1;

	return session;
}

BOOST_AUTO_TEST_CASE(CreateAndLoad)
{
	TestDir testDir;
	SessionStore store(testDir.getSubdir("sessions/nested") );

	UploadSession session = makeSession("clip.mp4");
	store.createSession(session);

	UploadSession loaded;
	BOOST_REQUIRE(store.loadSession(session.sessionID, loaded) );

	BOOST_CHECK_EQUAL(loaded.sessionID, session.sessionID);
	BOOST_CHECK_EQUAL(loaded.localPath, session.localPath);
	BOOST_CHECK_EQUAL(loaded.bucketRole, BucketRole_OUTPUTS);
	BOOST_CHECK_EQUAL(loaded.bucketName, "outputs-bucket");
	BOOST_CHECK_EQUAL(loaded.objectKey, "clip.mp4");
	BOOST_CHECK_EQUAL(loaded.totalSize, 25);
	BOOST_CHECK_EQUAL(loaded.chunkSize, 10);
	BOOST_CHECK_EQUAL(loaded.concurrency, 2);
	BOOST_CHECK_EQUAL(loaded.uploadID, "upload-1");
	BOOST_CHECK_EQUAL(loaded.status, SessionStatus_INPROGRESS);
	BOOST_CHECK_EQUAL(loaded.attribs.contentType, "video/mp4");
	BOOST_CHECK(loaded.attribs.metadata == session.attribs.metadata);
	BOOST_CHECK_EQUAL(loaded.createdAt, 1700000000);
	BOOST_CHECK_EQUAL(loaded.updatedAt, 1700000100);
	BOOST_CHECK(loaded.failureType.empty() );

	BOOST_REQUIRE_EQUAL(loaded.parts.size(), 3);
	BOOST_CHECK_EQUAL(loaded.parts[0].status, PartStatus_UPLOADED);
	BOOST_CHECK_EQUAL(loaded.parts[0].eTag, "\"etag-1\"");
	BOOST_CHECK_EQUAL(loaded.parts[0].attemptCount, 2);
	BOOST_CHECK_EQUAL(loaded.parts[1].status, PartStatus_UPLOADING);
	BOOST_CHECK_EQUAL(loaded.parts[2].offset, 20);
	BOOST_CHECK_EQUAL(loaded.parts[2].length, 5);
	BOOST_CHECK_EQUAL(loaded.parts[2].status, PartStatus_PENDING);
}

BOOST_AUTO_TEST_CASE(FailureTypeIsPersisted)
{
	TestDir testDir;
	SessionStore store(testDir.getSubdir("sessions") );

	UploadSession session = makeSession("clip.mp4");
	session.status = SessionStatus_FAILED;
	session.failureType = "SessionCorruptionError";

	store.createSession(session);

	UploadSession loaded;
	BOOST_REQUIRE(store.loadSession(session.sessionID, loaded) );

	BOOST_CHECK_EQUAL(loaded.status, SessionStatus_FAILED);
	BOOST_CHECK_EQUAL(loaded.failureType, "SessionCorruptionError");
}

BOOST_AUTO_TEST_CASE(DuplicateCreateIsRejected)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	UploadSession session = makeSession("clip.mp4");
	store.createSession(session);

	try
	{
		store.createSession(session);
		BOOST_FAIL("Expected exception for duplicate session");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_INVALIDSTATE);
		BOOST_CHECK_EQUAL(e.getSessionID(), session.sessionID);
	}
}

BOOST_AUTO_TEST_CASE(SaveReplacesRecord)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	UploadSession session = makeSession("clip.mp4");
	store.createSession(session);

	session.parts[1].status = PartStatus_UPLOADED;
	session.parts[1].eTag = "\"etag-2\"";
	store.saveSession(session);

	UploadSession loaded;
	BOOST_REQUIRE(store.loadSession(session.sessionID, loaded) );
	BOOST_CHECK_EQUAL(loaded.parts[1].status, PartStatus_UPLOADED);
	BOOST_CHECK_EQUAL(loaded.parts[1].eTag, "\"etag-2\"");

	// atomic replace leaves no temp files behind
	StringVec fileNames;
	for(const fs::directory_entry& entry : fs::directory_iterator(testDir.getPath() ) )
		fileNames.push_back(entry.path().filename().string() );

	BOOST_REQUIRE_EQUAL(fileNames.size(), 1);
	BOOST_CHECK_EQUAL(fileNames[0], session.sessionID + SESSIONSTORE_FILE_SUFFIX);
}

BOOST_AUTO_TEST_CASE(LoadMissingAndDelete)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	UploadSession session = makeSession("clip.mp4");
	UploadSession loaded;

	BOOST_CHECK(!store.loadSession(session.sessionID, loaded) );

	store.createSession(session);
	store.deleteSession(session.sessionID);

	BOOST_CHECK(!store.loadSession(session.sessionID, loaded) );

	// deleting a non-existing record is not an error
	BOOST_CHECK_NO_THROW(store.deleteSession(session.sessionID) );
}

BOOST_AUTO_TEST_CASE(InvalidSessionIDIsRejected)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	UploadSession loaded;

	try
	{
		store.loadSession("../../etc/passwd", loaded);
		BOOST_FAIL("Expected exception for invalid session ID");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_NOTFOUND);
	}
}

BOOST_AUTO_TEST_CASE(CorruptRecord)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	UploadSession goodSession = makeSession("good.mp4");
	UploadSession badSession = makeSession("bad.mp4");

	store.createSession(goodSession);

	{
		std::ofstream fileStream(testDir.getPath() + "/" + badSession.sessionID +
			SESSIONSTORE_FILE_SUFFIX);
		fileStream << "{ \"id\": \"" << badSession.sessionID << "\", \"truncated";
	}

	UploadSession loaded;

	try
	{
		store.loadSession(badSession.sessionID, loaded);
		BOOST_FAIL("Expected exception for corrupt session record");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_SESSIONCORRUPTION);
	}

	// listing skips the corrupt record
	UploadSessionVec sessions;
	store.listSessions(sessions);

	BOOST_REQUIRE_EQUAL(sessions.size(), 1);
	BOOST_CHECK_EQUAL(sessions[0].sessionID, goodSession.sessionID);
}

BOOST_AUTO_TEST_CASE(ListSessions)
{
	TestDir testDir;
	SessionStore store(testDir.getPath() );

	store.createSession(makeSession("a.mp4") );
	store.createSession(makeSession("b.mp4") );
	store.createSession(makeSession("c.mp4") );

	// unrelated files in the store dir are ignored
	{
		std::ofstream fileStream(testDir.getPath() + "/notes.json");
		fileStream << "{}";
	}

	UploadSessionVec sessions;
	store.listSessions(sessions);

	BOOST_CHECK_EQUAL(sessions.size(), 3);
}
