// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_STRINGTK_H_
#define TOOLKITS_STRINGTK_H_

#include <algorithm>
#include <ctime>
#include "Common.h"


/**
 * A toolkit of static helper functions for string generation and string manipulation.
 */
class StringTk
{
	public:
		static std::string generateDefaultObjectKey(const std::string& localPath, time_t now);
		static std::string timeToStr(time_t timestamp);
		static std::string makeObjectURL(std::string endpointURL, const std::string& bucketName,
			const std::string& objectKey);
		static void parseKeyValueList(const StringVec& keyValueStrVec, StringMap& outMap);

	private:
		StringTk() {}

	// inliners
	public:
		/**
		 * Remove any characters matching std::iscntrl from this string. Newline is among the
		 * matching characters.
		 */
		static void eraseControlChars(std::string &str)
		{
		    str.erase(std::remove_if(str.begin(), str.end(),
                [&](char ch)
                    { return std::iscntrl(static_cast<unsigned char>(ch) ); } ),
		        str.end() );
		}

};



#endif /* TOOLKITS_STRINGTK_H_ */
