// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_S3TK_H_
#define TOOLKITS_S3TK_H_

#include <memory>
#include <string>

#ifdef S3_SUPPORT
	#include <aws/core/Aws.h>
	#include <aws/core/utils/memory/AWSMemory.h>
	#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
	#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
	#include <aws/s3/S3Client.h>

	namespace S3 = Aws::S3::Model;
	using S3Client = Aws::S3::S3Client;
	using S3Errors = Aws::S3::S3Errors;
	using S3ErrorType = Aws::S3::S3Error;
	using S3ClientConfiguration = Aws::Client::ClientConfiguration;

	/**
	 * Aws::IOStream derived in-memory stream implementation for S3 part upload. The actual
	 * in-memory part comes from the streambuf that gets provided to the constructor.
	 */
	class S3MemoryStream : public Aws::IOStream
	{
		public:
			S3MemoryStream(unsigned char* buf, uint64_t bufLen) :
				Aws::IOStream(&staticZeroStreamBuf), streamBuf(buf, bufLen)
			{
				/* staticZeroStreamBuf was only because base class needs to be init'ed before our
					streamBuf, so immediately replace with actual streamBuf now that it's ready */
				rdbuf(&streamBuf);
			}

			virtual ~S3MemoryStream() = default;

		private:
			static std::stringbuf staticZeroStreamBuf; /* only for first init of std::iostream
				because that needs to be done before streamBuf init */

			Aws::Utils::Stream::PreallocatedStreamBuf streamBuf;
	};

#endif // S3_SUPPORT


class UploadConfig; // forward declaration


class S3Tk
{
	public:
		static void initS3Global(const UploadConfig& config);
		static void uninitS3Global();

#ifdef S3_SUPPORT
		static std::shared_ptr<S3Client> initS3Client(const UploadConfig& config);
		[[noreturn]] static void throwStorageException(const std::string& errorMessage,
			const S3ErrorType& s3Error);
#endif // S3_SUPPORT

	private:
		S3Tk() {}

#ifdef S3_SUPPORT
		static bool globalInitCalled; // to make uninit a no-op if init wasn't called

		static Aws::SDKOptions* s3SDKOptions;
#endif // S3_SUPPORT
};

#endif /* TOOLKITS_S3TK_H_ */
