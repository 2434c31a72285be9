// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TESTS_TESTDIR_H_
#define TESTS_TESTDIR_H_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "ProgException.h"

namespace fs = std::filesystem;


/**
 * Temporary directory that gets removed with all its contents on destruction.
 */
class TestDir
{
	public:
		TestDir()
		{
			std::string pathTemplate =
				(fs::temp_directory_path() / "uploadmgr_test_XXXXXX").string();

			if(!mkdtemp(&pathTemplate[0] ) )
				throw ProgException("Unable to create temporary test directory. "
					"Template: " + pathTemplate);

			path = pathTemplate;
		}

		~TestDir()
		{
			std::error_code errorCode;

			fs::remove_all(path, errorCode);
		}

		/**
		 * Create a file with a position-dependent byte pattern, so that misplaced parts change the
		 * content.
		 *
		 * @return path of the new file.
		 */
		std::string makePatternFile(const std::string& fileName, uint64_t fileSize)
		{
			const std::string filePath = path + "/" + fileName;

			std::ofstream fileStream(filePath, std::ios::binary | std::ios::trunc);

			for(uint64_t i=0; i < fileSize; i++)
				fileStream.put( (char)( (i * 31 + (i >> 12) ) & 0xFF) );

			if(!fileStream)
				throw ProgException("Unable to write test file. Path: " + filePath);

			return filePath;
		}

		/**
		 * Create a sparse file that reads as zeros.
		 *
		 * @return path of the new file.
		 */
		std::string makeSparseFile(const std::string& fileName, uint64_t fileSize)
		{
			const std::string filePath = path + "/" + fileName;

			{
				std::ofstream fileStream(filePath, std::ios::binary | std::ios::trunc);
			}

			if(truncate(filePath.c_str(), fileSize) == -1)
				throw ProgException("Unable to create sparse test file. Path: " + filePath);

			return filePath;
		}

		static std::string readFile(const std::string& filePath)
		{
			std::ifstream fileStream(filePath, std::ios::binary);

			return std::string(std::istreambuf_iterator<char>(fileStream),
				std::istreambuf_iterator<char>() );
		}

		std::string getSubdir(const std::string& name) const
		{
			return path + "/" + name;
		}

	private:
		std::string path;

	// inliners
	public:
		const std::string& getPath() const { return path; }
};

#endif /* TESTS_TESTDIR_H_ */
