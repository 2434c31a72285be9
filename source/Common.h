// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef COMMON_H_
#define COMMON_H_

#include <boost/config.hpp> // for BOOST_LIKELY
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

typedef std::list<std::string> StringList;
typedef std::set<std::string> StringSet;
typedef std::vector<std::string> StringVec;
typedef std::map<std::string, std::string> StringMap;
typedef std::vector<int> IntVec;
typedef std::vector<size_t> SizeTVec;
typedef std::vector<uint64_t> UInt64Vec;


#define STRINGIZE(value)		_STRINGIZE(value) // 2 levels necessary for macro expansion
#define _STRINGIZE(value)		#value


/**
 * Default access mode bits for new session record files.
 */
#define MKFILE_MODE				(S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH)
#define MKDIR_MODE				0755

/**
 * Call delete() on an object pointer if it's not NULL and afterwards set it to NULL.
 */
#define SAFE_DELETE(objectPointer) \
	do \
	{ \
		if(objectPointer) \
		{ \
			delete(objectPointer); \
			objectPointer = NULL; \
		}  \
	} while(0)

/**
 * Call free on a pointer if it's not NULL and afterwards set it to NULL.
 */
#define SAFE_FREE(pointer) \
	do \
	{ \
		if(pointer) \
		{ \
			free(pointer); \
			pointer = NULL; \
		}  \
	} while(0)


// tell the compiler that a code path is likely/unlikely to optimize performance of "good" paths
#ifdef BOOST_UNLIKELY
	#define IF_UNLIKELY(condition)	if(BOOST_UNLIKELY(condition) )
	#define IF_LIKELY(condition)	if(BOOST_LIKELY(!!(condition) ) )
#else // fallback for older boost versions
	#define IF_UNLIKELY(condition)	if(__builtin_expect(condition, 0) )
	#define IF_LIKELY(condition)	if(__builtin_expect(!!(condition), 1) )
#endif


/**
 * Bucket roles. The caller only ever names a role; UploadConfig resolves it to a bucket name.
 */
enum BucketRole
{
	BucketRole_MODELS = 0,
	BucketRole_OUTPUTS,
	BucketRole_UPLOADS,
	BucketRole_BACKUPS,
	BucketRole_TEMP,

	BucketRole_NUMROLES, // must be last, not a valid role
};

#define BUCKETROLE_MODELS_STR	"models"
#define BUCKETROLE_OUTPUTS_STR	"outputs"
#define BUCKETROLE_UPLOADS_STR	"uploads"
#define BUCKETROLE_BACKUPS_STR	"backups"
#define BUCKETROLE_TEMP_STR		"temp"


/**
 * Caller-supplied progress notification.
 *
 * @percent overall progress in range 0..100.
 * @numBytesDone bytes acknowledged by the backend so far.
 * @numBytesTotal total bytes of the upload.
 */
typedef std::function<void(double percent, uint64_t numBytesDone, uint64_t numBytesTotal)>
	ProgressCallback;


#endif /* COMMON_H_ */
