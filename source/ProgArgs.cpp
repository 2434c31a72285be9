// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <fstream>
#include <iostream>
#include <sstream>
#include "ProgArgs.h"
#include "ProgException.h"
#include "toolkits/StringTk.h"
#include "toolkits/TerminalTk.h"
#include "toolkits/TranslatorTk.h"
#include "toolkits/UnitTk.h"

#define ENDL						<< std::endl << // just to make help text print lines shorter

#define AWS_SDK_LOGPREFIX_DEFAULT	"aws_sdk_"
#define SECS_PER_DAY				(24 * 60 * 60)


ProgArgs::ProgArgs(int argc, char** argv) :
	argsGenericDescription("", TerminalTk::getTerminalLineLength(80) )
{
	this->argc = argc;
	this->argv = argv;

	defineDefaults();
	defineAllowedArgs();

	try
	{
		// parse user-given command line args

		bpo::options_description argsDescription;
		argsDescription.add(argsGenericDescription).add(argsHiddenDescription);

		bpo::positional_options_description positionalArgsDescription;
		positionalArgsDescription.add(ARG_COMMAND_LONG, 1);
		positionalArgsDescription.add(ARG_COMMANDARGS_LONG, -1); // "-1" means "all remaining"

		bpo::store(bpo::command_line_parser(argc, argv).
			options(argsDescription).
			positional(positionalArgsDescription).
			run(),
			argsVariablesMap);
		bpo::notify(argsVariablesMap);
	}
	catch(bpo::too_many_positional_options_error& e)
	{
		throw ProgException(std::string("Too many positional options error: ") + e.what() );
	}
	catch(bpo::error_with_option_name& e)
	{
		throw ProgException(std::string("Error for option name: ") + e.what() );
	}
	catch(std::exception& e)
	{
		throw ProgException(std::string("Arguments error: ") + e.what() );
	}

	LoggerBase::setFilterLevel( (LogLevel)logLevel);

	if(hasUserRequestedHelp() || hasUserRequestedVersion() )
		return;

	bpo::options_description configFileOptions;
	configFileOptions.add(argsGenericDescription); // same options in file as on command line

	if(!configFilePath.empty() )
	{
		std::ifstream ifs{configFilePath.c_str() };
		if(!ifs)
			throw ProgException(std::string("Cannot open config file: " + configFilePath) );

		try
		{
			// note: command line values take precedence, as bpo::store doesn't overwrite
			bpo::store(bpo::parse_config_file(ifs, configFileOptions), argsVariablesMap);
			bpo::notify(argsVariablesMap);
		}
		catch(std::exception& e)
		{
			throw ProgException("Config file error: " + configFilePath + "; " + e.what() );
		}

		LoggerBase::setFilterLevel( (LogLevel)logLevel);
	}

	parseCommand();
	convertUnitStrings();
	fillUploadConfig();
	checkCommandArgs();
}

/**
 * Define default values for args that don't get them through bpo::value() below.
 */
void ProgArgs::defineDefaults()
{
	UploadConfig defaultConfig;

	logLevel = Log_NORMAL;

	command = Command_UPLOAD;

	callTimeoutSecs = defaultConfig.callTimeoutMS / 1000;
	connectTimeoutMS = defaultConfig.connectTimeoutMS;
	s3LogLevel = 0;
	s3LogfilePrefix = AWS_SDK_LOGPREFIX_DEFAULT;

	multipartThresholdOrigStr = std::to_string(defaultConfig.sizePolicy.multipartThreshold);
	tierListStr = defaultConfig.sizePolicy.tiersToString();
	minPartSizeOrigStr = std::to_string(defaultConfig.minPartSize);
	maxPartSizeOrigStr = std::to_string(defaultConfig.maxPartSize);
	maxNumParts = defaultConfig.maxNumParts;
	maxPartAttempts = defaultConfig.maxPartAttempts;
	retryBaseMS = defaultConfig.retryBaseMS;
	numCompletionRetries = defaultConfig.numCompletionRetries;
	progressIntervalMS = defaultConfig.progressIntervalMS;
	sessionDir = SESSIONDIR_DEFAULT;
	sessionRetentionDays = defaultConfig.sessionRetentionSecs / SECS_PER_DAY;
	sseAlgorithm = UPLOADCONFIG_SSE_NONE;
	usePublicReadACL = false;

	bucketRole = BucketRole_UPLOADS;
	chunkSize = 0;
	numThreads = 0;
	listRemoteUploads = false;
	presignTTLSecs = UPLOADCONFIG_PRESIGN_TTL_SECS;
	disableProgressLine = false;
}

/**
 * Define allowed args and their descriptions.
 */
void ProgArgs::defineAllowedArgs()
{
	argsGenericDescription.add_options()
/*at*/	(ARG_ATTEMPTS_LONG, bpo::value(&this->maxPartAttempts),
			"Max number of attempts per part (including the first attempt) before a transient "
			"error fails the upload. (Default: " STRINGIZE(UPLOADCONFIG_MAX_PARTATTEMPTS) ")")
/*ba*/	(ARG_BUCKETBACKUPS_LONG, bpo::value(&this->bucketBackups),
			"Bucket name for role \"" BUCKETROLE_BACKUPS_STR "\".")
/*c*/	(ARG_CONFIGFILE_LONG "," ARG_CONFIGFILE_SHORT, bpo::value(&this->configFilePath),
			"Path to config file. Contains lines of \"option=value\" for the long options "
			"listed here. Command line values take precedence.")
/*ca*/	(ARG_CALLTIMEOUT_LONG, bpo::value(&this->callTimeoutSecs),
			"Timeout in seconds for a single backend call, e.g. one part upload. "
			"(Default: 300)")
/*ch*/	(ARG_CHUNKSIZE_LONG, bpo::value(&this->chunkSizeOrigStr),
			"Part size override for \"" COMMAND_UPLOAD_STR "\". Supports base2 suffixes, e.g. "
			"\"64M\". (Default: from size tiers)")
/*co*/	(ARG_COMPLETERETRIES_LONG, bpo::value(&this->numCompletionRetries),
			"Number of retries of a rejected multipart completion request. After that, the "
			"remote upload gets aborted. (Default: " STRINGIZE(UPLOADCONFIG_COMPLETION_RETRIES) ")")
/*co*/	(ARG_CONNECTTIMEOUT_LONG, bpo::value(&this->connectTimeoutMS),
			"Connect timeout in milliseconds. (Default: 5000)")
/*co*/	(ARG_CONTENTTYPE_LONG, bpo::value(&this->contentType),
			"Content type of the new object. (Default: derived from file extension)")
/*en*/	(ARG_ENDPOINT_LONG, bpo::value(&this->endpointURL),
			"S3 endpoint URL, e.g. \"https://s3.wasabisys.com\".")
/*h*/	(ARG_HELP_LONG "," ARG_HELP_SHORT,
			"Print this help message.")
/*k*/	(ARG_KEY_LONG "," ARG_KEY_SHORT, bpo::value(&this->objectKey),
			"Remote object key. For \"" COMMAND_UPLOAD_STR "\", the default is "
			"\"YYYYmmdd_HHMMSS_<filename>\".")
/*lo*/	(ARG_LOGLEVEL_LONG, bpo::value(&this->logLevel),
			"Log level. (Default: 0; Verbose: 1; Debug: 2)")
/*ma*/	(ARG_MAXNUMPARTS_LONG, bpo::value(&this->maxNumParts),
			"Backend max number of parts per upload. "
			"(Default: " STRINGIZE(UPLOADCONFIG_MAX_NUMPARTS) ")")
/*ma*/	(ARG_MAXPARTSIZE_LONG, bpo::value(&this->maxPartSizeOrigStr),
			"Backend max part size. (Default: 5G)")
/*me*/	(ARG_METADATA_LONG, bpo::value(&this->metadataVec),
			"Object metadata as \"key=value\". May be given multiple times.")
/*mi*/	(ARG_MINPARTSIZE_LONG, bpo::value(&this->minPartSizeOrigStr),
			"Backend min size of non-final parts. (Default: 5M)")
/*mo*/	(ARG_BUCKETMODELS_LONG, bpo::value(&this->bucketModels),
			"Bucket name for role \"" BUCKETROLE_MODELS_STR "\".")
/*no*/	(ARG_NOPROGRESS_LONG, bpo::bool_switch(&this->disableProgressLine),
			"Disable the console progress line.")
/*ou*/	(ARG_BUCKETOUTPUTS_LONG, bpo::value(&this->bucketOutputs),
			"Bucket name for role \"" BUCKETROLE_OUTPUTS_STR "\".")
/*pr*/	(ARG_PREFIX_LONG, bpo::value(&this->keyPrefix),
			"Object key prefix for \"" COMMAND_LIST_STR " --" ARG_REMOTE_LONG "\".")
/*pr*/	(ARG_PROGRESSINTERVAL_LONG, bpo::value(&this->progressIntervalMS),
			"Min interval in milliseconds between progress updates. "
			"(Default: " STRINGIZE(UPLOADCONFIG_PROGRESSINTERVAL_MS) ")")
/*pu*/	(ARG_PUBLICREAD_LONG, bpo::bool_switch(&this->usePublicReadACL),
			"Create objects with public-read ACL.")
/*r*/	(ARG_ROLE_LONG "," ARG_ROLE_SHORT, bpo::value(&this->bucketRoleStr),
			"Bucket role: \"" BUCKETROLE_MODELS_STR "\", \"" BUCKETROLE_OUTPUTS_STR "\", \""
			BUCKETROLE_UPLOADS_STR "\", \"" BUCKETROLE_BACKUPS_STR "\" or \""
			BUCKETROLE_TEMP_STR "\".")
/*re*/	(ARG_REGION_LONG, bpo::value(&this->region),
			"S3 region.")
/*re*/	(ARG_REMOTE_LONG, bpo::bool_switch(&this->listRemoteUploads),
			"For \"" COMMAND_LIST_STR "\": List in-progress multipart uploads on the backend "
			"instead of local sessions.")
/*re*/	(ARG_RETENTION_LONG, bpo::value(&this->sessionRetentionDays),
			"Days after last update until \"" COMMAND_CLEANUP_STR "\" deletes a session record. "
			"(Default: 7)")
/*re*/	(ARG_RETRYBASE_LONG, bpo::value(&this->retryBaseMS),
			"Base delay in milliseconds of the exponential retry backoff. "
			"(Default: " STRINGIZE(UPLOADCONFIG_RETRYBASE_MS) ")")
/*s3*/	(ARG_S3ACCESSKEY_LONG, bpo::value(&this->s3AccessKey),
			"S3 access key. (Default: AWS default credentials provider chain)")
/*s3*/	(ARG_S3LOGLEVEL_LONG, bpo::value(&this->s3LogLevel),
			"AWS SDK log level. (Default: 0 for disabled; Fatal: 1; Error: 2; Warn: 3; Info: 4; "
			"Debug: 5; Trace: 6)")
/*s3*/	(ARG_S3LOGFILEPREFIX_LONG, bpo::value(&this->s3LogfilePrefix),
			"AWS SDK log file prefix. (Default: \"" AWS_SDK_LOGPREFIX_DEFAULT "\")")
/*s3*/	(ARG_S3ACCESSSECRET_LONG, bpo::value(&this->s3AccessSecret),
			"S3 secret key.")
/*se*/	(ARG_SESSIONDIR_LONG, bpo::value(&this->sessionDir),
			"Directory of session records for resume. (Default: " "/var/tmp/" EXE_NAME
			"_sessions)")
/*ss*/	(ARG_SSE_LONG, bpo::value(&this->sseAlgorithm),
			"Server-side encryption: \"" UPLOADCONFIG_SSE_AES256 "\" or empty for none.")
/*t*/	(ARG_THREADS_LONG "," ARG_THREADS_SHORT, bpo::value(&this->numThreads),
			"Concurrency override for \"" COMMAND_UPLOAD_STR "\". Clamped to 1.."
			STRINGIZE(UPLOADCONFIG_MAX_CONCURRENCY) ". (Default: from size tiers)")
/*te*/	(ARG_BUCKETTEMP_LONG, bpo::value(&this->bucketTemp),
			"Bucket name for role \"" BUCKETROLE_TEMP_STR "\".")
/*th*/	(ARG_THRESHOLD_LONG, bpo::value(&this->multipartThresholdOrigStr),
			"Files of this size and larger are uploaded in parts. (Default: 64M)")
/*ti*/	(ARG_TIERS_LONG, bpo::value(&this->tierListStr),
			"Size tiers as comma-separated list of \"UPPERBOUND:CHUNK:THREADS\". The upper "
			"bound of the last tier is \"" UPLOADCONFIG_TIER_UNBOUNDED_STR "\". "
			"(Default: \"1G:8M:10,10G:32M:5,max:64M:2\")")
/*tt*/	(ARG_TTL_LONG, bpo::value(&this->presignTTLSecs),
			"Lifetime in seconds of presigned URLs. "
			"(Default: " STRINGIZE(UPLOADCONFIG_PRESIGN_TTL_SECS) ")")
/*up*/	(ARG_BUCKETUPLOADS_LONG, bpo::value(&this->bucketUploads),
			"Bucket name for role \"" BUCKETROLE_UPLOADS_STR "\".")
/*ve*/	(ARG_VERSION_LONG,
			"Print version and included optional build features.")
	;

	argsHiddenDescription.add_options()
		(ARG_COMMAND_LONG, bpo::value(&this->commandStr),
			"Command to run.")
		(ARG_COMMANDARGS_LONG, bpo::value(&this->commandArgsVec),
			"Arguments of command.")
	;
}

/**
 * @throw ProgException if command is missing or unknown.
 */
void ProgArgs::parseCommand()
{
	if(commandStr.empty() )
		throw ProgException("No command given. See \"--" ARG_HELP_LONG "\".");

	if(commandStr == COMMAND_UPLOAD_STR)
		command = Command_UPLOAD;
	else
	if(commandStr == COMMAND_RESUME_STR)
		command = Command_RESUME;
	else
	if(commandStr == COMMAND_ABORT_STR)
		command = Command_ABORT;
	else
	if(commandStr == COMMAND_PROGRESS_STR)
		command = Command_PROGRESS;
	else
	if(commandStr == COMMAND_LIST_STR)
		command = Command_LIST;
	else
	if(commandStr == COMMAND_INFO_STR)
		command = Command_INFO;
	else
	if(commandStr == COMMAND_PRESIGN_STR)
		command = Command_PRESIGN;
	else
	if(commandStr == COMMAND_CLEANUP_STR)
		command = Command_CLEANUP;
	else
		throw ProgException("Unknown command: " + commandStr);

	if(!bucketRoleStr.empty() )
		bucketRole = TranslatorTk::strToBucketRole(bucketRoleStr);

	StringTk::parseKeyValueList(metadataVec, metadataMap);
}

/**
 * Convert human strings with units (e.g. "8M") to bytes.
 *
 * @throw ProgException if a string can't be converted.
 */
void ProgArgs::convertUnitStrings()
{
	chunkSize = UnitTk::numHumanToBytesBinary(chunkSizeOrigStr, false);

	uploadConfig.sizePolicy.multipartThreshold =
		UnitTk::numHumanToBytesBinary(multipartThresholdOrigStr, true);
	uploadConfig.minPartSize = UnitTk::numHumanToBytesBinary(minPartSizeOrigStr, true);
	uploadConfig.maxPartSize = UnitTk::numHumanToBytesBinary(maxPartSizeOrigStr, true);

	uploadConfig.sizePolicy.tiers.clear();
	SizePolicy::parseTierList(tierListStr, uploadConfig.sizePolicy.tiers);
}

/**
 * Copy parsed values to uploadConfig and check it.
 *
 * @throw ProgException on invalid values.
 */
void ProgArgs::fillUploadConfig()
{
	uploadConfig.endpointURL = endpointURL;
	uploadConfig.region = region;
	uploadConfig.accessKey = s3AccessKey;
	uploadConfig.secretKey = s3AccessSecret;
	uploadConfig.callTimeoutMS = callTimeoutSecs * 1000;
	uploadConfig.connectTimeoutMS = connectTimeoutMS;
	uploadConfig.sdkLogLevel = s3LogLevel;
	uploadConfig.sdkLogfilePrefix = s3LogfilePrefix;

	uploadConfig.setBucketName(BucketRole_MODELS, bucketModels);
	uploadConfig.setBucketName(BucketRole_OUTPUTS, bucketOutputs);
	uploadConfig.setBucketName(BucketRole_UPLOADS, bucketUploads);
	uploadConfig.setBucketName(BucketRole_BACKUPS, bucketBackups);
	uploadConfig.setBucketName(BucketRole_TEMP, bucketTemp);

	uploadConfig.maxNumParts = maxNumParts;
	uploadConfig.maxPartAttempts = maxPartAttempts;
	uploadConfig.retryBaseMS = retryBaseMS;
	uploadConfig.numCompletionRetries = numCompletionRetries;
	uploadConfig.progressIntervalMS = progressIntervalMS;
	uploadConfig.sessionDir = sessionDir;
	uploadConfig.sessionRetentionSecs = (uint64_t)sessionRetentionDays * SECS_PER_DAY;
	uploadConfig.sseAlgorithm = sseAlgorithm;
	uploadConfig.usePublicReadACL = usePublicReadACL;

	uploadConfig.checkConfig();

	LOGGER(Log_DEBUG, "CONFIG VALUES: "
		"endpoint: " << endpointURL << "; "
		"region: " << region << "; "
		"threshold: " << uploadConfig.sizePolicy.multipartThreshold << "; "
		"tiers: " << uploadConfig.sizePolicy.tiersToString() << "; "
		"minPartSize: " << uploadConfig.minPartSize << "; "
		"attempts: " << maxPartAttempts << "; "
		"retryBaseMS: " << retryBaseMS << "; "
		"sessionDir: " << sessionDir << std::endl);
}

/**
 * Check that the command got the positional args and options it needs.
 *
 * @throw ProgException if something is missing.
 */
void ProgArgs::checkCommandArgs()
{
	const bool requiresRole = (command == Command_UPLOAD) || (command == Command_LIST) ||
		(command == Command_INFO) || (command == Command_PRESIGN);
	const bool requiresKey = (command == Command_INFO) || (command == Command_PRESIGN);

	if(requiresRole && bucketRoleStr.empty() )
		throw ProgException("Command \"" + commandStr + "\" requires a bucket role. "
			"See \"--" ARG_ROLE_LONG "\".");

	if(requiresKey && objectKey.empty() )
		throw ProgException("Command \"" + commandStr + "\" requires an object key. "
			"See \"--" ARG_KEY_LONG "\".");

	switch(command)
	{
		case Command_UPLOAD:
		case Command_ABORT:
		case Command_PROGRESS:
		{
			if(commandArgsVec.size() != 1)
				throw ProgException("Command \"" + commandStr + "\" requires exactly one "
					"argument.");
		} break;

		case Command_RESUME:
		{ // either "resume <sessionID>" or "resume <path> --role R --key K"
			if(commandArgsVec.size() != 1)
				throw ProgException("Command \"" + commandStr + "\" requires exactly one "
					"argument.");

			if(bucketRoleStr.empty() != objectKey.empty() )
				throw ProgException("Resume by local path requires both bucket role and object "
					"key.");
		} break;

		default:
		{
			if(!commandArgsVec.empty() )
				throw ProgException("Command \"" + commandStr + "\" takes no arguments.");
		} break;
	}
}

/**
 * Check if user gave the argument to print help. If this returns true, then the rest of the
 * settings in this class is not initialized, so may not be used.
 *
 * @return true if help text was requested.
 */
bool ProgArgs::hasUserRequestedHelp()
{
	if(argsVariablesMap.count(ARG_HELP_LONG) || (argc <= 1) )
		return true;

	return false;
}

bool ProgArgs::hasUserRequestedVersion()
{
	return argsVariablesMap.count(ARG_VERSION_LONG) != 0;
}

/**
 * Print help text based on user-given selection.
 */
void ProgArgs::printHelp()
{
	printHelpOverview();
	printHelpAllOptions();
}

void ProgArgs::printHelpOverview()
{
	std::cout <<
		EXE_NAME " - Resumable multipart uploads to S3-compatible object storage" ENDL
		std::endl <<
		"Version: " EXE_VERSION ENDL
		std::endl <<
		"Files of the multipart threshold size and larger are uploaded in parallel parts. The" ENDL
		"state of each part is recorded locally, so an interrupted upload can be resumed" ENDL
		"without sending already uploaded parts again." ENDL
		std::endl <<
		"Usage: " EXE_NAME " [OPTIONS] COMMAND [ARGS]" ENDL
		std::endl <<
		"Commands:" ENDL
		"  " COMMAND_UPLOAD_STR " PATH         Upload local file. Requires --" ARG_ROLE_LONG "." ENDL
		"  " COMMAND_RESUME_STR " SESSIONID    Resume upload by session ID." ENDL
		"  " COMMAND_RESUME_STR " PATH         Resume upload by --" ARG_ROLE_LONG " and --"
			ARG_KEY_LONG ", also without session record." ENDL
		"  " COMMAND_ABORT_STR " SESSIONID     Abort upload and its remote multipart upload." ENDL
		"  " COMMAND_PROGRESS_STR " SESSIONID  Show progress of upload." ENDL
		"  " COMMAND_LIST_STR "                Show resumable sessions of --" ARG_ROLE_LONG "." ENDL
		"  " COMMAND_INFO_STR "                Show object info of --" ARG_ROLE_LONG " and --"
			ARG_KEY_LONG "." ENDL
		"  " COMMAND_PRESIGN_STR "             Print presigned download URL." ENDL
		"  " COMMAND_CLEANUP_STR "             Delete expired session records." ENDL
		std::endl <<
		"Examples:" ENDL
		"  Upload a model file:" ENDL
		"    $ " EXE_NAME " --" ARG_ENDPOINT_LONG " https://s3.example.com --" ARG_BUCKETMODELS_LONG
			" mymodels \\" ENDL
		"        --" ARG_ROLE_LONG " " BUCKETROLE_MODELS_STR " " COMMAND_UPLOAD_STR
			" /data/model.safetensors" ENDL
		"  Resume after interruption:" ENDL
		"    $ " EXE_NAME " -" ARG_CONFIGFILE_SHORT " uploadmgr.conf " COMMAND_RESUME_STR
			" <SESSIONID>" ENDL
		std::endl;
}

void ProgArgs::printHelpAllOptions()
{
	std::cout << "Options:" << std::endl;
	std::cout << argsGenericDescription << std::endl;
}

/**
 * Print version and included optional build features.
 */
void ProgArgs::printVersionAndBuildInfo()
{
	std::ostringstream includedStream; // included optional build features
	std::ostringstream notIncludedStream; // not included optional build features

	std::cout << EXE_NAME << std::endl;
	std::cout << " * Version: " EXE_VERSION << std::endl;
	std::cout << " * Build date: " __DATE__ << " " << __TIME__ << std::endl;

#ifdef S3_SUPPORT
	includedStream << "s3 ";
#else
	notIncludedStream << "s3 ";
#endif

	std::cout << " * Included optional build features: " <<
		(includedStream.str().empty() ? "-" : includedStream.str() ) << std::endl;
	std::cout << " * Excluded optional build features: " <<
		(notIncludedStream.str().empty() ? "-" : notIncludedStream.str() ) << std::endl;
}
