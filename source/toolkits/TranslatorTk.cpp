// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/algorithm/string.hpp>
#include "ProgException.h"
#include "storage/StorageException.h"
#include "TranslatorTk.h"
#include "workers/WorkerException.h"

#define SESSIONSTATUS_PENDING_STR		"Pending"
#define SESSIONSTATUS_INPROGRESS_STR	"InProgress"
#define SESSIONSTATUS_COMPLETED_STR		"Completed"
#define SESSIONSTATUS_ABORTED_STR		"Aborted"
#define SESSIONSTATUS_FAILED_STR		"Failed"

#define PARTSTATUS_PENDING_STR			"Pending"
#define PARTSTATUS_UPLOADING_STR		"Uploading"
#define PARTSTATUS_UPLOADED_STR			"Uploaded"
#define PARTSTATUS_FAILED_STR			"Failed"


/**
 * @return BUCKETROLE_..._STR
 * @throw ProgException on invalid bucketRole value
 */
std::string TranslatorTk::bucketRoleToStr(BucketRole bucketRole)
{
	switch(bucketRole)
	{
		case BucketRole_MODELS: return BUCKETROLE_MODELS_STR;
		case BucketRole_OUTPUTS: return BUCKETROLE_OUTPUTS_STR;
		case BucketRole_UPLOADS: return BUCKETROLE_UPLOADS_STR;
		case BucketRole_BACKUPS: return BUCKETROLE_BACKUPS_STR;
		case BucketRole_TEMP: return BUCKETROLE_TEMP_STR;
		default:
			throw ProgException("Invalid bucket role: " + std::to_string(bucketRole) );
	}
}

/**
 * @bucketRoleStr BUCKETROLE_..._STR, case-insensitive.
 * @throw ProgException on unknown string
 */
BucketRole TranslatorTk::strToBucketRole(const std::string& bucketRoleStr)
{
	const std::string lowerStr = boost::algorithm::to_lower_copy(bucketRoleStr);

	if(lowerStr == BUCKETROLE_MODELS_STR)
		return BucketRole_MODELS;
	if(lowerStr == BUCKETROLE_OUTPUTS_STR)
		return BucketRole_OUTPUTS;
	if(lowerStr == BUCKETROLE_UPLOADS_STR)
		return BucketRole_UPLOADS;
	if(lowerStr == BUCKETROLE_BACKUPS_STR)
		return BucketRole_BACKUPS;
	if(lowerStr == BUCKETROLE_TEMP_STR)
		return BucketRole_TEMP;

	throw ProgException("Unknown bucket role: \"" + bucketRoleStr + "\". "
		"Valid roles: "
		BUCKETROLE_MODELS_STR ", " BUCKETROLE_OUTPUTS_STR ", " BUCKETROLE_UPLOADS_STR ", "
		BUCKETROLE_BACKUPS_STR ", " BUCKETROLE_TEMP_STR);
}

std::string TranslatorTk::sessionStatusToStr(SessionStatus sessionStatus)
{
	switch(sessionStatus)
	{
		case SessionStatus_PENDING: return SESSIONSTATUS_PENDING_STR;
		case SessionStatus_INPROGRESS: return SESSIONSTATUS_INPROGRESS_STR;
		case SessionStatus_COMPLETED: return SESSIONSTATUS_COMPLETED_STR;
		case SessionStatus_ABORTED: return SESSIONSTATUS_ABORTED_STR;
		case SessionStatus_FAILED: return SESSIONSTATUS_FAILED_STR;
		default:
			throw ProgException("Invalid session status: " + std::to_string(sessionStatus) );
	}
}

SessionStatus TranslatorTk::strToSessionStatus(const std::string& sessionStatusStr)
{
	if(sessionStatusStr == SESSIONSTATUS_PENDING_STR)
		return SessionStatus_PENDING;
	if(sessionStatusStr == SESSIONSTATUS_INPROGRESS_STR)
		return SessionStatus_INPROGRESS;
	if(sessionStatusStr == SESSIONSTATUS_COMPLETED_STR)
		return SessionStatus_COMPLETED;
	if(sessionStatusStr == SESSIONSTATUS_ABORTED_STR)
		return SessionStatus_ABORTED;
	if(sessionStatusStr == SESSIONSTATUS_FAILED_STR)
		return SessionStatus_FAILED;

	throw ProgException("Unknown session status: \"" + sessionStatusStr + "\"");
}

std::string TranslatorTk::partStatusToStr(PartStatus partStatus)
{
	switch(partStatus)
	{
		case PartStatus_PENDING: return PARTSTATUS_PENDING_STR;
		case PartStatus_UPLOADING: return PARTSTATUS_UPLOADING_STR;
		case PartStatus_UPLOADED: return PARTSTATUS_UPLOADED_STR;
		case PartStatus_FAILED: return PARTSTATUS_FAILED_STR;
		default:
			throw ProgException("Invalid part status: " + std::to_string(partStatus) );
	}
}

PartStatus TranslatorTk::strToPartStatus(const std::string& partStatusStr)
{
	if(partStatusStr == PARTSTATUS_PENDING_STR)
		return PartStatus_PENDING;
	if(partStatusStr == PARTSTATUS_UPLOADING_STR)
		return PartStatus_UPLOADING;
	if(partStatusStr == PARTSTATUS_UPLOADED_STR)
		return PartStatus_UPLOADED;
	if(partStatusStr == PARTSTATUS_FAILED_STR)
		return PartStatus_FAILED;

	throw ProgException("Unknown part status: \"" + partStatusStr + "\"");
}

std::string TranslatorTk::uploadErrorTypeToStr(UploadErrorType errorType)
{
	switch(errorType)
	{
		case UploadErr_TRANSIENTEXHAUSTED: return "TransientNetworkError";
		case UploadErr_AUTH: return "AuthError";
		case UploadErr_PARTSIZE: return "PartSizeViolation";
		case UploadErr_INVALIDPOLICY: return "InvalidSizePolicy";
		case UploadErr_SESSIONCORRUPTION: return "SessionCorruptionError";
		case UploadErr_QUOTA: return "QuotaExceededError";
		case UploadErr_BACKEND: return "BackendError";
		case UploadErr_LOCALIO: return "LocalIOError";
		case UploadErr_NOTFOUND: return "NotFound";
		case UploadErr_INVALIDSTATE: return "InvalidState";
		default: return "Unknown(" + std::to_string(errorType) + ")";
	}
}

/**
 * Classify an error for the caller of UploadOrchestrator.
 *
 * Backend errors map to their UploadErr_... counterpart; an unknown multipart upload means that
 * local session and remote state disagree. Worker errors are local source file errors.
 */
UploadErrorType TranslatorTk::exceptionToUploadErrorType(const std::exception& e)
{
	if(const UploadException* uploadException = dynamic_cast<const UploadException*>(&e) )
		return uploadException->getErrorType();

	if(dynamic_cast<const StorageTransientException*>(&e) )
		return UploadErr_TRANSIENTEXHAUSTED;

	if(dynamic_cast<const StorageAuthException*>(&e) )
		return UploadErr_AUTH;

	if(dynamic_cast<const StoragePartSizeException*>(&e) )
		return UploadErr_PARTSIZE;

	if(dynamic_cast<const StorageQuotaException*>(&e) )
		return UploadErr_QUOTA;

	if(dynamic_cast<const StorageNotFoundException*>(&e) )
		return UploadErr_SESSIONCORRUPTION;

	if(dynamic_cast<const StorageException*>(&e) )
		return UploadErr_BACKEND;

	if(dynamic_cast<const WorkerException*>(&e) )
		return UploadErr_LOCALIO;

	return UploadErr_BACKEND;
}

/**
 * Convert vector of strings to single string with given separator between elements.
 */
std::string TranslatorTk::stringVecToString(const StringVec& vec, std::string separator)
{
	std::string result;

	for(const std::string& elem : vec)
	{
		if(!result.empty() )
			result += separator; // this is not the first element, so add separator

		result += elem;
	}

	return result;
}

/**
 * Split string at any of the given delimiters, trim surrounding whitespace of each element and drop
 * elements that are empty after trimming.
 */
void TranslatorTk::splitAndTrimStr(const std::string& str, const std::string& delimiters,
	StringVec& outVec)
{
	StringVec splitVec;

	boost::split(splitVec, str, boost::is_any_of(delimiters) );

	for(std::string& elem : splitVec)
	{
		boost::trim(elem);

		if(!elem.empty() )
			outVec.push_back(elem);
	}
}
