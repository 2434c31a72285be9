// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <cstdlib>
#include "Common.h"
#include "Logger.h"
#include "storage/StorageException.h"
#include "toolkits/S3Tk.h"
#include "UploadConfig.h"

#ifdef S3_SUPPORT
	#include <aws/core/auth/AWSCredentialsProvider.h>
	#include <aws/core/auth/AWSCredentialsProviderChain.h>
	#include <aws/core/client/DefaultRetryStrategy.h>
	#include <aws/core/http/HttpResponse.h>
	#include <aws/core/utils/logging/DefaultLogSystem.h>
	#include <aws/core/utils/logging/AWSLogging.h>


	std::stringbuf S3MemoryStream::staticZeroStreamBuf;

	bool S3Tk::globalInitCalled = false;
	Aws::SDKOptions* S3Tk::s3SDKOptions = NULL;
#endif // S3_SUPPORT



/**
 * Globally initialize the AWS SDK. Run this before any other threads are running and only once
 * for the whole application lifetime.
 *
 * This is a no-op if this executable was built without S3 support.
 *
 * Note: The SDK initializer contains (amongst others) curl_global_init(), which must be called
 * before any threads are started. The SDK uninit method also does not reset the init-done-already
 * flag in ShutdownAPI(), which is why initialization can only be done once and will not work again
 * after ShutdownAPI was called.
 */
void S3Tk::initS3Global(const UploadConfig& config)
{
#ifdef S3_SUPPORT

	if(globalInitCalled)
	{
		LOGGER(Log_DEBUG, "Skipping repeated S3 SDK init." << std::endl);
		return;
	}

	LOGGER(Log_DEBUG, "Initializing S3 SDK." << std::endl);

	globalInitCalled = true;

	s3SDKOptions = new Aws::SDKOptions;

	if(config.sdkLogLevel > 0)
	{
		const Aws::Utils::Logging::LogLevel logLevel =
			(Aws::Utils::Logging::LogLevel)config.sdkLogLevel;
		const std::string logfilePrefix = config.sdkLogfilePrefix;

		s3SDKOptions->loggingOptions.logLevel = logLevel;

		s3SDKOptions->loggingOptions.logger_create_fn = [logLevel, logfilePrefix]()
		{
			return Aws::MakeShared<Aws::Utils::Logging::DefaultLogSystem>(
				"CustomLogSystem", logLevel, logfilePrefix);
		};
	}

	Aws::InitAPI(*s3SDKOptions);

	/* note: this is to avoid a long delay for the client config trying to contact the
		AWS instance metadata service to retrieve credentials, although we already set them.
		this way, it can still manually be overridden through the environment variable. */
	setenv("AWS_EC2_METADATA_DISABLED", "true", 0);

#endif // S3_SUPPORT
}

/**
 * Globally uninitialize the AWS SDK. Call this only once for the whole application lifetime. (See
 * S3Tk::initS3Global comments for why this may only be called once.)
 */
void S3Tk::uninitS3Global()
{
#ifdef S3_SUPPORT

	if(!globalInitCalled)
		return; // nothing to do if init wasn't called

	LOGGER(Log_DEBUG, "Shutting down S3 SDK." << std::endl);

	Aws::ShutdownAPI(*s3SDKOptions);

	SAFE_DELETE(s3SDKOptions);

#endif // S3_SUPPORT
}

#ifdef S3_SUPPORT

/**
 * Initialize S3 client object for the configured endpoint. The client is thread-safe, so a single
 * instance is shared by all upload workers.
 *
 * SDK-internal retries are disabled, because retry of parts with backoff is done by the upload
 * workers, which can also react to abort requests between attempts.
 *
 * @throw ProgException if config has no endpoint.
 */
std::shared_ptr<S3Client> S3Tk::initS3Client(const UploadConfig& config)
{
	if(config.endpointURL.empty() )
		throw ProgException(std::string(__func__) + " cannot init S3 client if no S3 endpoint is "
			"provided.");

	S3ClientConfiguration clientConfig;

	clientConfig.enableEndpointDiscovery = false; // to avoid delays for discovery
	clientConfig.maxConnections = UPLOADCONFIG_MAX_CONCURRENCY + 1; // +1 for list/complete calls
	clientConfig.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(0);
	clientConfig.connectTimeoutMs = config.connectTimeoutMS;
	clientConfig.requestTimeoutMs = config.callTimeoutMS;
	clientConfig.disableExpectHeader = true;
	clientConfig.enableTcpKeepAlive = true;
	clientConfig.endpointOverride = config.endpointURL;

	if(!config.region.empty() )
		clientConfig.region = config.region;

	/* note: just passing Aws::Auth::AWSCredentials to the s3client constructor doesn't override
		credentials from profiles in home directory, so we need to pass a CredentialsProvider. */

	std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentialsProvider;

	if(!config.accessKey.empty() )
	{
		credentialsProvider = std::make_shared<Aws::Auth::SimpleAWSCredentialsProvider>(
			config.accessKey, config.secretKey);

		LOGGER(Log_DEBUG, "Using configured S3 credentials." << std::endl);
	}
	else
	{
		credentialsProvider = std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>();

		LOGGER(Log_DEBUG, "Using default AWS credential chain." << std::endl);
	}

	LOGGER(Log_DEBUG, "Creating S3 client. "
		"Endpoint: " << config.endpointURL << "; "
		"Region: " << clientConfig.region << "; "
		"CallTimeoutMS: " << config.callTimeoutMS << std::endl);

	// path-style addressing (last arg) for compatibility with non-AWS S3 services
	return std::make_shared<S3Client>(credentialsProvider, clientConfig,
		Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, false);
}

/**
 * Classify an S3 error and throw the corresponding StorageException subclass.
 *
 * @errorMessage description of the failed request, S3 error details get appended.
 */
void S3Tk::throwStorageException(const std::string& errorMessage, const S3ErrorType& s3Error)
{
	const int httpCode = (int)s3Error.GetResponseCode();
	const std::string exceptionName = s3Error.GetExceptionName().c_str();

	const std::string fullMessage = errorMessage +
		"Exception: " + exceptionName + "; "
		"Message: " + s3Error.GetMessage().c_str() + "; "
		"HTTP Error Code: " + std::to_string(httpCode);

	// part size and quota errors have no dedicated S3Errors value, so check the exception name

	if( (exceptionName == "EntityTooSmall") || (exceptionName == "EntityTooLarge") )
		throw StoragePartSizeException(fullMessage);

	if( (exceptionName == "QuotaExceeded") || (exceptionName == "StorageQuotaExceeded") )
		throw StorageQuotaException(fullMessage);

	switch(s3Error.GetErrorType() )
	{
		case S3Errors::ACCESS_DENIED:
		case S3Errors::INVALID_ACCESS_KEY_ID:
		case S3Errors::SIGNATURE_DOES_NOT_MATCH:
		case S3Errors::MISSING_AUTHENTICATION_TOKEN:
		case S3Errors::UNRECOGNIZED_CLIENT:
			throw StorageAuthException(fullMessage);

		case S3Errors::NO_SUCH_UPLOAD:
		case S3Errors::NO_SUCH_KEY:
		case S3Errors::NO_SUCH_BUCKET:
		case S3Errors::RESOURCE_NOT_FOUND:
			throw StorageNotFoundException(fullMessage);

		case S3Errors::NETWORK_CONNECTION:
		case S3Errors::REQUEST_TIMEOUT:
		case S3Errors::REQUEST_TIME_TOO_SKEWED:
		case S3Errors::SLOW_DOWN:
		case S3Errors::THROTTLING:
		case S3Errors::SERVICE_UNAVAILABLE:
		case S3Errors::INTERNAL_FAILURE:
			throw StorageTransientException(fullMessage);

		default:
			break;
	}

	if( (httpCode == 401) || (httpCode == 403) )
		throw StorageAuthException(fullMessage);

	if( (httpCode == 429) || (httpCode >= 500) || s3Error.ShouldRetry() )
		throw StorageTransientException(fullMessage);

	throw StorageException(fullMessage);
}

#endif // S3_SUPPORT
