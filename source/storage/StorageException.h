// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef STORAGE_STORAGEEXCEPTION_H_
#define STORAGE_STORAGEEXCEPTION_H_

#include "ProgException.h"

/**
 * Non-retryable backend rejection that doesn't fall into one of the more specific classes below.
 */
class StorageException : public ProgException
{
	public:
		explicit StorageException(const std::string& errorMessage) :
			ProgException(errorMessage) {};
};

/**
 * Timeout, connection failure, throttling or 5xx response. The only class that callers retry.
 */
class StorageTransientException : public StorageException
{
	public:
		explicit StorageTransientException(const std::string& errorMessage) :
			StorageException(errorMessage) {};
};

/**
 * Credentials rejected by backend.
 */
class StorageAuthException : public StorageException
{
	public:
		explicit StorageAuthException(const std::string& errorMessage) :
			StorageException(errorMessage) {};
};

/**
 * Part size outside of what the backend accepts (EntityTooSmall / EntityTooLarge).
 */
class StoragePartSizeException : public StorageException
{
	public:
		explicit StoragePartSizeException(const std::string& errorMessage) :
			StorageException(errorMessage) {};
};

/**
 * Backend storage quota exceeded.
 */
class StorageQuotaException : public StorageException
{
	public:
		explicit StorageQuotaException(const std::string& errorMessage) :
			StorageException(errorMessage) {};
};

/**
 * Unknown multipart upload ID or non-existing object.
 */
class StorageNotFoundException : public StorageException
{
	public:
		explicit StorageNotFoundException(const std::string& errorMessage) :
			StorageException(errorMessage) {};
};


#endif /* STORAGE_STORAGEEXCEPTION_H_ */
