// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <boost/algorithm/string.hpp>
#include <dirent.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "Logger.h"
#include "ProgException.h"
#include "toolkits/FileTk.h"

namespace fs = std::filesystem;

#define FILETK_TMPFILE_SUFFIX	".tmp"


/**
 * @return size of the given file.
 * @throw ProgException if file doesn't exist, can't be accessed or is not a regular file.
 */
uint64_t FileTk::getFileSize(const std::string& path)
{
	struct stat statBuf;

	int statRes = stat(path.c_str(), &statBuf);
	if(statRes == -1)
		throw ProgException("Getting file size failed. "
			"Path: " + path + "; "
			"SysErr: " + strerror(errno) );

	if(!S_ISREG(statBuf.st_mode) )
		throw ProgException("Not a regular file. "
			"Path: " + path);

	return statBuf.st_size;
}

/**
 * Try to create the given dir. If this fails because the parents at higher levels don't exist,
 * then try to create the parents from deepest level bottom up to highest level.
 *
 * return 0 on success, "-1" and errno on error similar to mkdir(). EEXIST is not treated as error.
 */
int FileTk::mkdirBottomUp(const char* path, mode_t mode)
{
	int mkdirRes = mkdir(path, mode);

	if(!mkdirRes || (errno == EEXIST) )
		return 0;

	if(errno == ENOENT)
	{ // parent doesn't exist yet
		fs::path pathObj(path);
		fs::path parentPathObj = pathObj.parent_path();
		if( (parentPathObj == pathObj) || parentPathObj.empty() )
		{ // we reached the root
			errno = ENOENT;
			return -1;
		}

		int mkdirParentRes = mkdirBottomUp(parentPathObj.string().c_str(), mode);
		if(mkdirParentRes == -1)
			return mkdirParentRes; // parent creation failed

		// parent creation succeeded, so try again to create actual dir
		mkdirRes = mkdir(path, mode);
		if(!mkdirRes || (errno == EEXIST) )
			return 0;
	}

	// any error that's not ENOENT and not EEXIST
	return -1;
}

/**
 * Replace the contents of the given file so that readers either see the complete old or the
 * complete new contents: write to a temporary file in the same dir, fsync it and rename it over the
 * old file.
 *
 * @throw ProgException on error.
 */
void FileTk::writeFileAtomic(const std::string& path, const std::string& contents)
{
	const std::string tmpPath = path + FILETK_TMPFILE_SUFFIX;

	int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, MKFILE_MODE);
	if(fd == -1)
		throw ProgException("Unable to open file for writing. "
			"Path: " + tmpPath + "; "
			"SysErr: " + strerror(errno) );

	size_t numBytesDone = 0;

	while(numBytesDone < contents.size() )
	{
		ssize_t writeRes = write(fd, contents.data() + numBytesDone,
			contents.size() - numBytesDone);

		if(writeRes == -1)
		{
			if(errno == EINTR)
				continue;

			std::string sysErrStr = strerror(errno);

			close(fd);
			unlink(tmpPath.c_str() );

			throw ProgException("File write failed. "
				"Path: " + tmpPath + "; "
				"SysErr: " + sysErrStr);
		}

		numBytesDone += writeRes;
	}

	int fsyncRes = fsync(fd);
	if(fsyncRes == -1)
	{
		std::string sysErrStr = strerror(errno);

		close(fd);
		unlink(tmpPath.c_str() );

		throw ProgException("File sync failed. "
			"Path: " + tmpPath + "; "
			"SysErr: " + sysErrStr);
	}

	int closeRes = close(fd);
	if(closeRes == -1)
	{
		std::string sysErrStr = strerror(errno);

		unlink(tmpPath.c_str() );

		throw ProgException("File close failed. "
			"Path: " + tmpPath + "; "
			"SysErr: " + sysErrStr);
	}

	int renameRes = rename(tmpPath.c_str(), path.c_str() );
	if(renameRes == -1)
	{
		std::string sysErrStr = strerror(errno);

		unlink(tmpPath.c_str() );

		throw ProgException("Unable to rename file. "
			"OldPath: " + tmpPath + "; "
			"NewPath: " + path + "; "
			"SysErr: " + sysErrStr);
	}
}

/**
 * Read complete contents of the given file.
 *
 * @throw ProgException on error.
 */
void FileTk::readFile(const std::string& path, std::string& outContents)
{
	std::ifstream fileStream(path, std::ifstream::binary);

	if(!fileStream)
		throw ProgException("Unable to open file for reading. "
			"Path: " + path + "; "
			"SysErr: " + strerror(errno) );

	std::ostringstream contentsStream;
	contentsStream << fileStream.rdbuf();

	if(fileStream.bad() )
		throw ProgException("File read failed. "
			"Path: " + path);

	outContents = contentsStream.str();
}

/**
 * Get names (not paths) of regular files in given dir that end with given suffix. Hidden files are
 * skipped.
 *
 * @suffix empty string to match all files.
 * @throw ProgException if dir can't be read.
 */
void FileTk::listDirFiles(const std::string& dirPath, const std::string& suffix,
	StringVec& outFileNames)
{
	DIR* dir = opendir(dirPath.c_str() );
	if(!dir)
		throw ProgException("Unable to open directory. "
			"Path: " + dirPath + "; "
			"SysErr: " + strerror(errno) );

	for( ; ; )
	{
		errno = 0;

		struct dirent* dirEntry = readdir(dir);
		if(!dirEntry)
			break;

		const std::string fileName(dirEntry->d_name);

		if(fileName.empty() || (fileName[0] == '.') )
			continue;

		if(!boost::algorithm::ends_with(fileName, suffix) )
			continue;

		if( (dirEntry->d_type != DT_REG) && (dirEntry->d_type != DT_UNKNOWN) )
			continue;

		outFileNames.push_back(fileName);
	}

	int readdirErrno = errno;

	closedir(dir);

	if(readdirErrno)
		throw ProgException("Reading directory entries failed. "
			"Path: " + dirPath + "; "
			"SysErr: " + strerror(readdirErrno) );
}

/**
 * Map the file extension (case-insensitive) to a MIME content type.
 *
 * @return FILETK_CONTENTTYPE_DEFAULT for unknown extensions.
 */
std::string FileTk::getContentTypeByExtension(const std::string& path)
{
	static const StringMap contentTypes =
	{
		// video
		{".mp4", "video/mp4"},
		{".avi", "video/x-msvideo"},
		{".mov", "video/quicktime"},
		{".mkv", "video/x-matroska"},
		{".webm", "video/webm"},
		{".flv", "video/x-flv"},
		{".wmv", "video/x-ms-wmv"},
		{".m4v", "video/x-m4v"},
		{".3gp", "video/3gpp"},

		// audio
		{".mp3", "audio/mpeg"},
		{".wav", "audio/wav"},
		{".flac", "audio/flac"},
		{".aac", "audio/aac"},
		{".ogg", "audio/ogg"},
		{".m4a", "audio/mp4"},
		{".wma", "audio/x-ms-wma"},

		// image
		{".jpg", "image/jpeg"},
		{".jpeg", "image/jpeg"},
		{".png", "image/png"},
		{".gif", "image/gif"},
		{".bmp", "image/bmp"},
		{".tiff", "image/tiff"},
		{".webp", "image/webp"},
		{".svg", "image/svg+xml"},

		// documents and archives
		{".pdf", "application/pdf"},
		{".json", "application/json"},
		{".xml", "application/xml"},
		{".zip", "application/zip"},
		{".rar", "application/x-rar-compressed"},
		{".7z", "application/x-7z-compressed"},
		{".tar", "application/x-tar"},
		{".gz", "application/gzip"},
		{".js", "application/javascript"},
		{".yml", "application/x-yaml"},
		{".yaml", "application/x-yaml"},

		// text
		{".txt", "text/plain"},
		{".py", "text/x-python"},
		{".html", "text/html"},
		{".css", "text/css"},
		{".md", "text/markdown"},
		{".ini", "text/plain"},
		{".conf", "text/plain"},
		{".log", "text/plain"},
	};

	const std::string extension =
		boost::algorithm::to_lower_copy(fs::path(path).extension().string() );

	StringMap::const_iterator iter = contentTypes.find(extension);
	if(iter == contentTypes.end() )
		return FILETK_CONTENTTYPE_DEFAULT;

	return iter->second;
}

/**
 * @return last path element, e.g. "video.mp4" for "/data/out/video.mp4".
 */
std::string FileTk::getFileName(const std::string& path)
{
	return fs::path(path).filename().string();
}
