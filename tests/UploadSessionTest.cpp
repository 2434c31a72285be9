// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#define BOOST_TEST_MODULE UploadSessionTest

#include <boost/test/unit_test.hpp>
#include "UploadException.h"
#include "UploadSession.h"


static UploadSession makeSession(unsigned numParts, uint64_t chunkSize, uint64_t totalSize)
{
	UploadSession session;
	session.sessionID = UploadSession::makeSessionID("bucket", "key");
	session.totalSize = totalSize;
	session.chunkSize = chunkSize;

	for(unsigned i=0; i < numParts; i++)
	{
		PartRecord part;
		part.partNumber = i + 1;
		part.offset = i * chunkSize;
		part.length = (i == (numParts - 1) ) ? (totalSize - part.offset) : chunkSize;

		session.parts.push_back(part);
	}

	return session;
}

BOOST_AUTO_TEST_CASE(SessionIDIsStable)
{
	const std::string firstID = UploadSession::makeSessionID("bucket", "dir/video.mp4");

	BOOST_CHECK_EQUAL(firstID, UploadSession::makeSessionID("bucket", "dir/video.mp4") );
	BOOST_CHECK_NE(firstID, UploadSession::makeSessionID("bucket", "dir/video2.mp4") );
	BOOST_CHECK_NE(firstID, UploadSession::makeSessionID("bucket2", "dir/video.mp4") );
	BOOST_CHECK_EQUAL(firstID.length(), 36);
}

BOOST_AUTO_TEST_CASE(StatusTransitions)
{
	BOOST_CHECK(UploadSession::isValidTransition(SessionStatus_PENDING,
		SessionStatus_INPROGRESS) );
	BOOST_CHECK(UploadSession::isValidTransition(SessionStatus_PENDING,
		SessionStatus_COMPLETED) );
	BOOST_CHECK(UploadSession::isValidTransition(SessionStatus_INPROGRESS,
		SessionStatus_ABORTED) );
	BOOST_CHECK(UploadSession::isValidTransition(SessionStatus_INPROGRESS,
		SessionStatus_FAILED) );

	BOOST_CHECK(!UploadSession::isValidTransition(SessionStatus_INPROGRESS,
		SessionStatus_PENDING) );
	BOOST_CHECK(!UploadSession::isValidTransition(SessionStatus_COMPLETED,
		SessionStatus_INPROGRESS) );
	BOOST_CHECK(!UploadSession::isValidTransition(SessionStatus_ABORTED,
		SessionStatus_COMPLETED) );
	BOOST_CHECK(!UploadSession::isValidTransition(SessionStatus_FAILED,
		SessionStatus_INPROGRESS) );

	UploadSession session = makeSession(2, 10, 15);

	session.setStatus(SessionStatus_INPROGRESS);
	session.setStatus(SessionStatus_INPROGRESS); // no-op
	session.setStatus(SessionStatus_COMPLETED);

	try
	{
		session.setStatus(SessionStatus_ABORTED);
		BOOST_FAIL("Expected exception for transition out of terminal state");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_INVALIDSTATE);
	}

	BOOST_CHECK_EQUAL(session.status, SessionStatus_COMPLETED);
}

BOOST_AUTO_TEST_CASE(ProgressFromParts)
{
	UploadSession session = makeSession(4, 10, 35);

	session.parts[0].status = PartStatus_UPLOADED;
	session.parts[3].status = PartStatus_UPLOADED;
	session.parts[1].status = PartStatus_UPLOADING;

	ProgressSnapshot snapshot;
	session.computeProgress(snapshot);

	BOOST_CHECK_EQUAL(snapshot.numBytesDone, 15);
	BOOST_CHECK_EQUAL(snapshot.numBytesTotal, 35);
	BOOST_CHECK_EQUAL(snapshot.numPartsDone, 2);
	BOOST_CHECK_EQUAL(snapshot.numPartsTotal, 4);
	BOOST_CHECK_EQUAL(snapshot.numPartsUploading, 1);
	BOOST_CHECK_CLOSE(snapshot.percent, 100.0 * 15 / 35, 0.001);
}

BOOST_AUTO_TEST_CASE(SingleShotProgress)
{
	UploadSession session = makeSession(0, 0, 100);

	ProgressSnapshot snapshot;
	session.computeProgress(snapshot);
	BOOST_CHECK_EQUAL(snapshot.numBytesDone, 0);

	session.status = SessionStatus_COMPLETED;
	session.computeProgress(snapshot);
	BOOST_CHECK_EQUAL(snapshot.numBytesDone, 100);
	BOOST_CHECK_CLOSE(snapshot.percent, 100.0, 0.001);
}

BOOST_AUTO_TEST_CASE(OrderedPartETags)
{
	UploadSession session = makeSession(3, 10, 30);

	for(PartRecord& part : session.parts)
	{
		part.status = PartStatus_UPLOADED;
		part.eTag = "etag-" + std::to_string(part.partNumber);
	}

	PartETagVec partETags;
	session.getOrderedPartETags(partETags);

	BOOST_REQUIRE_EQUAL(partETags.size(), 3);

	for(unsigned i=0; i < 3; i++)
	{
		BOOST_CHECK_EQUAL(partETags[i].partNumber, i + 1);
		BOOST_CHECK_EQUAL(partETags[i].eTag, "etag-" + std::to_string(i + 1) );
	}

	session.parts[2].status = PartStatus_PENDING;

	BOOST_CHECK_THROW(session.getOrderedPartETags(partETags), UploadException);
}

BOOST_AUTO_TEST_CASE(PartsCoverage)
{
	UploadSession session = makeSession(3, 10, 25);
	BOOST_CHECK_NO_THROW(session.checkPartsCoverage() );

	UploadSession gapSession = makeSession(3, 10, 25);
	gapSession.parts[1].offset = 11;

	try
	{
		gapSession.checkPartsCoverage();
		BOOST_FAIL("Expected exception for gap between parts");
	}
	catch(UploadException& e)
	{
		BOOST_CHECK_EQUAL(e.getErrorType(), UploadErr_SESSIONCORRUPTION);
		BOOST_CHECK_EQUAL(e.getPartNumber(), 2);
	}

	UploadSession shortSession = makeSession(3, 10, 25);
	shortSession.totalSize = 30;

	BOOST_CHECK_THROW(shortSession.checkPartsCoverage(), UploadException);
}

BOOST_AUTO_TEST_CASE(GetPartRange)
{
	UploadSession session = makeSession(3, 10, 25);

	BOOST_CHECK(session.getPart(0) == NULL);
	BOOST_CHECK(session.getPart(4) == NULL);
	BOOST_REQUIRE(session.getPart(3) != NULL);
	BOOST_CHECK_EQUAL(session.getPart(3)->offset, 20);
}

BOOST_AUTO_TEST_CASE(MaxPartLength)
{
	BOOST_CHECK_EQUAL(makeSession(3, 10, 25).getMaxPartLength(), 10);
	BOOST_CHECK_EQUAL(makeSession(0, 0, 100).getMaxPartLength(), 0);

	// single part plan with a chunk size larger than the file
	UploadSession session = makeSession(1, 1024 * 1024, 4096);
	BOOST_CHECK_EQUAL(session.getMaxPartLength(), 4096);
}
