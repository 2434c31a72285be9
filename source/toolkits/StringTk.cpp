// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/algorithm/string.hpp>
#include "ProgException.h"
#include "toolkits/FileTk.h"
#include "toolkits/StringTk.h"


/**
 * Generate the object key that is used when the caller didn't provide one: local time as
 * "YYYYmmdd_HHMMSS", followed by "_" and the local file name.
 *
 * @localPath path of the source file; only the file name is used.
 * @now timestamp for the key prefix.
 */
std::string StringTk::generateDefaultObjectKey(const std::string& localPath, time_t now)
{
	char timeBuf[32];
	struct tm localTime;

	strftime(timeBuf, sizeof(timeBuf), "%Y%m%d_%H%M%S", localtime_r(&now, &localTime) );

	return std::string(timeBuf) + "_" + FileTk::getFileName(localPath);
}

/**
 * @return local time as "YYYY-mm-dd HH:MM:SS".
 */
std::string StringTk::timeToStr(time_t timestamp)
{
	char timeBuf[32];
	struct tm localTime;

	strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S",
		localtime_r(&timestamp, &localTime) );

	return timeBuf;
}

/**
 * Plain (path-style, not presigned) URL of an object.
 *
 * @endpointURL e.g. "https://s3.wasabisys.com"; a trailing slash is ignored.
 */
std::string StringTk::makeObjectURL(std::string endpointURL, const std::string& bucketName,
	const std::string& objectKey)
{
	while(!endpointURL.empty() && (endpointURL.back() == '/') )
		endpointURL.pop_back();

	return endpointURL + "/" + bucketName + "/" + objectKey;
}

/**
 * Parse "key=value" strings into a map. Surrounding whitespace and control characters are removed.
 *
 * @throw ProgException if an element has no "=" or an empty key.
 */
void StringTk::parseKeyValueList(const StringVec& keyValueStrVec, StringMap& outMap)
{
	for(std::string keyValueStr : keyValueStrVec)
	{
		eraseControlChars(keyValueStr);

		size_t separatorPos = keyValueStr.find('=');

		if(separatorPos == std::string::npos)
			throw ProgException("Invalid key/value pair. Expected format is \"key=value\". "
				"Given: \"" + keyValueStr + "\"");

		std::string key = boost::algorithm::trim_copy(keyValueStr.substr(0, separatorPos) );
		std::string value = boost::algorithm::trim_copy(keyValueStr.substr(separatorPos + 1) );

		if(key.empty() )
			throw ProgException("Invalid key/value pair with empty key. "
				"Given: \"" + keyValueStr + "\"");

		outMap[key] = value;
	}
}
