// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef PROGARGS_H_
#define PROGARGS_H_

#include <boost/program_options.hpp>
#include "Common.h"
#include "Logger.h"
#include "UploadConfig.h"


namespace bpo = boost::program_options;

/* command line args and config file options (sorted alphabetically by "ARG_..." column).
	note: keep length of "_LONG" argument names within a max length of 14 chars, as the
		description column in the help output otherwise gets too small. */
#define ARG_ATTEMPTS_LONG			"attempts"
#define ARG_BUCKETBACKUPS_LONG		"backupsbucket"
#define ARG_BUCKETMODELS_LONG		"modelsbucket"
#define ARG_BUCKETOUTPUTS_LONG		"outputsbucket"
#define ARG_BUCKETTEMP_LONG			"tempbucket"
#define ARG_BUCKETUPLOADS_LONG		"uploadsbucket"
#define ARG_CALLTIMEOUT_LONG		"calltimeout"
#define ARG_CHUNKSIZE_LONG			"chunk"
#define ARG_COMMAND_LONG			"command" // internal (positional)
#define ARG_COMMANDARGS_LONG		"commandarg" // internal (positional)
#define ARG_COMPLETERETRIES_LONG	"completeretry"
#define ARG_CONFIGFILE_LONG			"configfile"
#define ARG_CONFIGFILE_SHORT		"c"
#define ARG_CONNECTTIMEOUT_LONG		"conntimeout"
#define ARG_CONTENTTYPE_LONG		"contenttype"
#define ARG_ENDPOINT_LONG			"endpoint"
#define ARG_HELP_LONG				"help"
#define ARG_HELP_SHORT				"h"
#define ARG_KEY_LONG				"key"
#define ARG_KEY_SHORT				"k"
#define ARG_LOGLEVEL_LONG			"log"
#define ARG_MAXNUMPARTS_LONG		"maxparts"
#define ARG_MAXPARTSIZE_LONG		"maxpartsize"
#define ARG_METADATA_LONG			"meta"
#define ARG_MINPARTSIZE_LONG		"minpartsize"
#define ARG_NOPROGRESS_LONG			"noprogress"
#define ARG_PREFIX_LONG				"prefix"
#define ARG_PROGRESSINTERVAL_LONG	"progressint"
#define ARG_PUBLICREAD_LONG			"publicread"
#define ARG_REGION_LONG				"region"
#define ARG_REMOTE_LONG				"remote"
#define ARG_RETENTION_LONG			"retention"
#define ARG_RETRYBASE_LONG			"retrybase"
#define ARG_ROLE_LONG				"role"
#define ARG_ROLE_SHORT				"r"
#define ARG_S3ACCESSKEY_LONG		"s3key"
#define ARG_S3ACCESSSECRET_LONG		"s3secret"
#define ARG_S3LOGFILEPREFIX_LONG	"s3logprefix"
#define ARG_S3LOGLEVEL_LONG			"s3log"
#define ARG_SESSIONDIR_LONG			"sessiondir"
#define ARG_SSE_LONG				"sse"
#define ARG_THREADS_LONG			"threads"
#define ARG_THREADS_SHORT			"t"
#define ARG_THRESHOLD_LONG			"threshold"
#define ARG_TIERS_LONG				"tiers"
#define ARG_TTL_LONG				"ttl"
#define ARG_VERSION_LONG			"version"

// commands (first positional arg)
#define COMMAND_UPLOAD_STR			"upload"
#define COMMAND_RESUME_STR			"resume"
#define COMMAND_ABORT_STR			"abort"
#define COMMAND_PROGRESS_STR		"progress"
#define COMMAND_LIST_STR			"list"
#define COMMAND_INFO_STR			"info"
#define COMMAND_PRESIGN_STR			"presign"
#define COMMAND_CLEANUP_STR			"cleanup"

#define SESSIONDIR_DEFAULT			("/var/tmp/" EXE_NAME "_sessions")


enum Command
{
	Command_UPLOAD = 0,
	Command_RESUME,
	Command_ABORT,
	Command_PROGRESS,
	Command_LIST,
	Command_INFO,
	Command_PRESIGN,
	Command_CLEANUP,
};


/**
 * Parse command line args and config file into an UploadConfig plus the per-command options.
 */
class ProgArgs
{
	public:
		ProgArgs(int argc, char** argv);

		bool hasUserRequestedHelp();
		bool hasUserRequestedVersion();
		void printHelp();
		void printVersionAndBuildInfo();


	private:
		int argc; // command line argc
		char** argv; // command line argv
		bpo::options_description argsGenericDescription;
		bpo::options_description argsHiddenDescription;
		bpo::variables_map argsVariablesMap;

		UploadConfig uploadConfig; // filled from args after parsing

		std::string configFilePath; // user-defined config file path
		unsigned short logLevel; // filter level for log messages (higher will not be logged)

		Command command;
		std::string commandStr; // first positional arg
		StringVec commandArgsVec; // further positional args

		std::string endpointURL;
		std::string region;
		std::string s3AccessKey;
		std::string s3AccessSecret;
		unsigned callTimeoutSecs;
		unsigned connectTimeoutMS;
		unsigned short s3LogLevel;
		std::string s3LogfilePrefix;

		std::string bucketModels;
		std::string bucketOutputs;
		std::string bucketUploads;
		std::string bucketBackups;
		std::string bucketTemp;

		std::string multipartThresholdOrigStr;
		std::string tierListStr; // "UPPER:CHUNK:THREADS,..." with last UPPER "max"
		std::string minPartSizeOrigStr;
		std::string maxPartSizeOrigStr;
		unsigned maxNumParts;
		unsigned maxPartAttempts;
		unsigned retryBaseMS;
		unsigned numCompletionRetries;
		unsigned progressIntervalMS;
		std::string sessionDir;
		unsigned sessionRetentionDays;
		std::string sseAlgorithm;
		bool usePublicReadACL;

		BucketRole bucketRole;
		std::string bucketRoleStr;
		std::string objectKey;
		std::string contentType;
		StringVec metadataVec; // "key=value" strings
		StringMap metadataMap; // parsed from metadataVec
		std::string chunkSizeOrigStr;
		uint64_t chunkSize; // 0 means use size policy
		unsigned numThreads; // 0 means use size policy
		std::string keyPrefix;
		bool listRemoteUploads;
		unsigned presignTTLSecs;
		bool disableProgressLine;

		void defineDefaults();
		void defineAllowedArgs();
		void parseCommand();
		void convertUnitStrings();
		void fillUploadConfig();
		void checkCommandArgs();

		void printHelpOverview();
		void printHelpAllOptions();


	// inliners
	public:
		const UploadConfig& getUploadConfig() const { return uploadConfig; }
		Command getCommand() const { return command; }
		const std::string& getCommandStr() const { return commandStr; }
		const StringVec& getCommandArgsVec() const { return commandArgsVec; }
		BucketRole getBucketRole() const { return bucketRole; }
		const std::string& getObjectKey() const { return objectKey; }
		const std::string& getContentType() const { return contentType; }
		const StringMap& getMetadataMap() const { return metadataMap; }
		uint64_t getChunkSize() const { return chunkSize; }
		unsigned getNumThreads() const { return numThreads; }
		const std::string& getKeyPrefix() const { return keyPrefix; }
		bool getListRemoteUploads() const { return listRemoteUploads; }
		unsigned getPresignTTLSecs() const { return presignTTLSecs; }
		bool getDisableProgressLine() const { return disableProgressLine; }
		bool getIsBucketRoleGiven() const { return !bucketRoleStr.empty(); }
};


#endif /* PROGARGS_H_ */
