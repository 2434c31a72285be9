// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_FILETK_H_
#define TOOLKITS_FILETK_H_

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include "Common.h"

#define FILETK_CONTENTTYPE_DEFAULT		"application/octet-stream"


class FileTk
{
	public:
		static uint64_t getFileSize(const std::string& path);
		static int mkdirBottomUp(const char* path, mode_t mode);
		static void writeFileAtomic(const std::string& path, const std::string& contents);
		static void readFile(const std::string& path, std::string& outContents);
		static void listDirFiles(const std::string& dirPath, const std::string& suffix,
			StringVec& outFileNames);
		static std::string getContentTypeByExtension(const std::string& path);
		static std::string getFileName(const std::string& path);

	private:
		FileTk() {}


	// inliners
	public:
		/**
		 * Read exactly len bytes from given offset, continuing on short reads.
		 *
		 * @fd file descriptor opened for reading.
		 * @path only used for error messages.
		 *
		 * @throw template EXCEPTION on read error or unexpected end of file.
		 */
		template <class EXCEPTION>
		static void preadFull(int fd, char* buf, size_t len, uint64_t offset, const char* path)
		{
			size_t numBytesDone = 0;

			while(numBytesDone < len)
			{
				ssize_t readRes = pread(fd, buf + numBytesDone, len - numBytesDone,
					offset + numBytesDone);

				IF_UNLIKELY(readRes == -1)
				{
					if(errno == EINTR)
						continue;

					throw EXCEPTION(std::string("File read failed. ") +
						"File: " + path + "; "
						"Offset: " + std::to_string(offset + numBytesDone) + "; "
						"Length: " + std::to_string(len - numBytesDone) + "; "
						"SysErr: " + strerror(errno) );
				}

				IF_UNLIKELY(readRes == 0)
					throw EXCEPTION(std::string("Unexpected end of file. "
						"File might have been truncated. ") +
						"File: " + path + "; "
						"Offset: " + std::to_string(offset + numBytesDone) + "; "
						"ExpectedEnd: " + std::to_string(offset + len) );

				numBytesDone += readRes;
			}
		}
};



#endif /* TOOLKITS_FILETK_H_ */
