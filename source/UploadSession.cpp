// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "toolkits/TranslatorTk.h"
#include "UploadException.h"
#include "UploadSession.h"

#define SESSIONTREE_ID				"id"
#define SESSIONTREE_PATH			"path"
#define SESSIONTREE_ROLE			"role"
#define SESSIONTREE_BUCKET			"bucket"
#define SESSIONTREE_KEY				"key"
#define SESSIONTREE_SIZE			"size"
#define SESSIONTREE_CHUNK			"chunk"
#define SESSIONTREE_CONCURRENCY		"concurrency"
#define SESSIONTREE_UPLOADID		"uploadID"
#define SESSIONTREE_STATUS			"status"
#define SESSIONTREE_CONTENTTYPE		"contentType"
#define SESSIONTREE_METADATA		"metadata"
#define SESSIONTREE_CREATED			"created"
#define SESSIONTREE_UPDATED			"updated"
#define SESSIONTREE_PARTS			"parts"
#define SESSIONTREE_OBJECTETAG		"objectETag"
#define SESSIONTREE_FAILURE			"failure"

#define PARTTREE_NUMBER				"number"
#define PARTTREE_OFFSET				"offset"
#define PARTTREE_LENGTH				"length"
#define PARTTREE_ETAG				"etag"
#define PARTTREE_STATUS				"status"
#define PARTTREE_ATTEMPTS			"attempts"

#define METADATATREE_NAME			"name"
#define METADATATREE_VALUE			"value"

namespace buuids = boost::uuids;


/**
 * Derive a stable session ID from bucket and object key, so that a resume request without an
 * explicit ID can still find the session. (Name-based SHA1 UUID in the URL namespace.)
 */
std::string UploadSession::makeSessionID(const std::string& bucketName,
	const std::string& objectKey)
{
	buuids::name_generator_sha1 nameGenerator(buuids::ns::url() );

	buuids::uuid sessionUUID = nameGenerator("s3://" + bucketName + "/" + objectKey);

	return buuids::to_string(sessionUUID);
}

/**
 * Sessions only move forward along Pending -> InProgress -> {Completed, Aborted, Failed}. The
 * single-shot path may skip InProgress.
 */
bool UploadSession::isValidTransition(SessionStatus oldStatus, SessionStatus newStatus)
{
	switch(oldStatus)
	{
		case SessionStatus_PENDING:
			return (newStatus != SessionStatus_PENDING);

		case SessionStatus_INPROGRESS:
			return (newStatus == SessionStatus_COMPLETED) ||
				(newStatus == SessionStatus_ABORTED) ||
				(newStatus == SessionStatus_FAILED);

		default:
			return false; // terminal
	}
}

/**
 * Change session status and update modification time. Setting the current status again is a no-op.
 *
 * @throw UploadException if the transition is not allowed.
 */
void UploadSession::setStatus(SessionStatus newStatus)
{
	if(newStatus == status)
		return;

	if(!isValidTransition(status, newStatus) )
		throw UploadException(UploadErr_INVALIDSTATE, "Invalid session status transition. "
			"Old: " + TranslatorTk::sessionStatusToStr(status) + "; "
			"New: " + TranslatorTk::sessionStatusToStr(newStatus) + ";", sessionID);

	status = newStatus;

	touch();
}

/**
 * Compute progress from current part states.
 */
void UploadSession::computeProgress(ProgressSnapshot& outSnapshot) const
{
	outSnapshot = ProgressSnapshot();

	outSnapshot.numBytesTotal = totalSize;
	outSnapshot.numPartsTotal = parts.size();

	if(!isMultipart() )
	{ // single-shot upload: all or nothing
		if(status == SessionStatus_COMPLETED)
			outSnapshot.numBytesDone = totalSize;
	}
	else
	{
		for(const PartRecord& part : parts)
		{
			if(part.status == PartStatus_UPLOADED)
			{
				outSnapshot.numBytesDone += part.length;
				outSnapshot.numPartsDone++;
			}
			else
			if(part.status == PartStatus_UPLOADING)
				outSnapshot.numPartsUploading++;
		}
	}

	if(totalSize)
		outSnapshot.percent = (100.0 * outSnapshot.numBytesDone) / totalSize;
	else
		outSnapshot.percent = (status == SessionStatus_COMPLETED) ? 100 : 0;
}

/**
 * Get ETags of all uploaded parts in ascending part number order, as required for completion.
 *
 * @throw UploadException if any part has not been uploaded yet.
 */
void UploadSession::getOrderedPartETags(PartETagVec& outPartETags) const
{
	outPartETags.clear();
	outPartETags.reserve(parts.size() );

	// (note: parts vec is ordered by part number, see checkPartsCoverage() )

	for(const PartRecord& part : parts)
	{
		IF_UNLIKELY(part.status != PartStatus_UPLOADED)
			throw UploadException(UploadErr_INVALIDSTATE, "Unable to complete upload with parts "
				"that have not been uploaded.", sessionID, part.partNumber);

		PartETag partETag;
		partETag.partNumber = part.partNumber;
		partETag.eTag = part.eTag;

		outPartETags.push_back(partETag);
	}
}

/**
 * Check that parts are numbered 1..N and cover [0, totalSize) without gaps or overlaps.
 *
 * @throw UploadException if check fails.
 */
void UploadSession::checkPartsCoverage() const
{
	uint64_t nextOffset = 0;

	for(size_t i=0; i < parts.size(); i++)
	{
		const PartRecord& part = parts[i];

		if( (part.partNumber != (i+1) ) || (part.offset != nextOffset) || !part.length)
			throw UploadException(UploadErr_SESSIONCORRUPTION, "Session parts are not "
				"contiguous. "
				"Index: " + std::to_string(i) + "; "
				"Offset: " + std::to_string(part.offset) + "; "
				"ExpectedOffset: " + std::to_string(nextOffset) + "; "
				"Length: " + std::to_string(part.length) + ";",
				sessionID, part.partNumber);

		nextOffset += part.length;
	}

	if(isMultipart() && (nextOffset != totalSize) )
		throw UploadException(UploadErr_SESSIONCORRUPTION, "Session parts don't cover the total "
			"size. "
			"PartsSize: " + std::to_string(nextOffset) + "; "
			"TotalSize: " + std::to_string(totalSize) + ";", sessionID);
}

/**
 * Serialize session for the session store.
 */
void UploadSession::getAsPropertyTree(bpt::ptree& outTree) const
{
	outTree.put(SESSIONTREE_ID, sessionID);
	outTree.put(SESSIONTREE_PATH, localPath);
	outTree.put(SESSIONTREE_ROLE, TranslatorTk::bucketRoleToStr(bucketRole) );
	outTree.put(SESSIONTREE_BUCKET, bucketName);
	outTree.put(SESSIONTREE_KEY, objectKey);
	outTree.put(SESSIONTREE_SIZE, totalSize);
	outTree.put(SESSIONTREE_CHUNK, chunkSize);
	outTree.put(SESSIONTREE_CONCURRENCY, concurrency);
	outTree.put(SESSIONTREE_UPLOADID, uploadID);
	outTree.put(SESSIONTREE_STATUS, TranslatorTk::sessionStatusToStr(status) );
	outTree.put(SESSIONTREE_CONTENTTYPE, attribs.contentType);
	outTree.put(SESSIONTREE_CREATED, createdAt);
	outTree.put(SESSIONTREE_UPDATED, updatedAt);
	outTree.put(SESSIONTREE_OBJECTETAG, objectETag);
	outTree.put(SESSIONTREE_FAILURE, failureType);

	/* note: metadata keys are stored as values in a list instead of as tree keys, because keys may
		contain the ptree path separator '.' */

	bpt::ptree metadataTree;

	for(const auto& metadataPair : attribs.metadata)
	{
		bpt::ptree metadataEntry;
		metadataEntry.put(METADATATREE_NAME, metadataPair.first);
		metadataEntry.put(METADATATREE_VALUE, metadataPair.second);

		metadataTree.push_back(std::make_pair("", metadataEntry) );
	}

	outTree.add_child(SESSIONTREE_METADATA, metadataTree);

	bpt::ptree partsTree;

	for(const PartRecord& part : parts)
	{
		bpt::ptree partEntry;
		partEntry.put(PARTTREE_NUMBER, part.partNumber);
		partEntry.put(PARTTREE_OFFSET, part.offset);
		partEntry.put(PARTTREE_LENGTH, part.length);
		partEntry.put(PARTTREE_ETAG, part.eTag);
		partEntry.put(PARTTREE_STATUS, TranslatorTk::partStatusToStr(part.status) );
		partEntry.put(PARTTREE_ATTEMPTS, part.attemptCount);

		partsTree.push_back(std::make_pair("", partEntry) );
	}

	outTree.add_child(SESSIONTREE_PARTS, partsTree);
}

/**
 * Deserialize session from the session store.
 *
 * @throw bpt::ptree_error if a field is missing or has an invalid value; ProgException on unknown
 * 		enum strings.
 */
void UploadSession::setFromPropertyTree(const bpt::ptree& tree)
{
	sessionID = tree.get<std::string>(SESSIONTREE_ID);
	localPath = tree.get<std::string>(SESSIONTREE_PATH);
	bucketRole = TranslatorTk::strToBucketRole(tree.get<std::string>(SESSIONTREE_ROLE) );
	bucketName = tree.get<std::string>(SESSIONTREE_BUCKET);
	objectKey = tree.get<std::string>(SESSIONTREE_KEY);
	totalSize = tree.get<uint64_t>(SESSIONTREE_SIZE);
	chunkSize = tree.get<uint64_t>(SESSIONTREE_CHUNK);
	concurrency = tree.get<unsigned>(SESSIONTREE_CONCURRENCY);
	uploadID = tree.get<std::string>(SESSIONTREE_UPLOADID);
	status = TranslatorTk::strToSessionStatus(tree.get<std::string>(SESSIONTREE_STATUS) );
	attribs.contentType = tree.get<std::string>(SESSIONTREE_CONTENTTYPE);
	createdAt = tree.get<time_t>(SESSIONTREE_CREATED);
	updatedAt = tree.get<time_t>(SESSIONTREE_UPDATED);
	objectETag = tree.get<std::string>(SESSIONTREE_OBJECTETAG);
	failureType = tree.get<std::string>(SESSIONTREE_FAILURE, "");

	attribs.metadata.clear();

	for(const bpt::ptree::value_type& metadataItem : tree.get_child(SESSIONTREE_METADATA) )
		attribs.metadata[metadataItem.second.get<std::string>(METADATATREE_NAME)] =
			metadataItem.second.get<std::string>(METADATATREE_VALUE);

	parts.clear();

	for(const bpt::ptree::value_type& partItem : tree.get_child(SESSIONTREE_PARTS) )
	{
		PartRecord part;
		part.partNumber = partItem.second.get<unsigned>(PARTTREE_NUMBER);
		part.offset = partItem.second.get<uint64_t>(PARTTREE_OFFSET);
		part.length = partItem.second.get<uint64_t>(PARTTREE_LENGTH);
		part.eTag = partItem.second.get<std::string>(PARTTREE_ETAG);
		part.status = TranslatorTk::strToPartStatus(
			partItem.second.get<std::string>(PARTTREE_STATUS) );
		part.attemptCount = partItem.second.get<unsigned>(PARTTREE_ATTEMPTS);

		parts.push_back(part);
	}
}
