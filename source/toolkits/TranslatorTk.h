// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_TRANSLATORTK_H_
#define TOOLKITS_TRANSLATORTK_H_

#include <exception>
#include <string>
#include <vector>
#include "Common.h"
#include "UploadException.h"
#include "UploadSession.h"


/**
 * A toolkit of static methods to translate from one data structure into another.
 */
class TranslatorTk
{
	private:
		TranslatorTk() {}

	public:
		static std::string bucketRoleToStr(BucketRole bucketRole);
		static BucketRole strToBucketRole(const std::string& bucketRoleStr);
		static std::string sessionStatusToStr(SessionStatus sessionStatus);
		static SessionStatus strToSessionStatus(const std::string& sessionStatusStr);
		static std::string partStatusToStr(PartStatus partStatus);
		static PartStatus strToPartStatus(const std::string& partStatusStr);
		static std::string uploadErrorTypeToStr(UploadErrorType errorType);
		static UploadErrorType exceptionToUploadErrorType(const std::exception& e);
		static std::string stringVecToString(const StringVec& vec, std::string separator);
		static void splitAndTrimStr(const std::string& str, const std::string& delimiters,
			StringVec& outVec);
};


#endif /* TOOLKITS_TRANSLATORTK_H_ */
