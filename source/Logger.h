// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef LOGGER_H_
#define LOGGER_H_

#include <iostream>
#include <mutex>
#include <sstream>
#include <sys/time.h>

#define LOGGER(logLevel, stream) 	do { Logger(logLevel) << stream; } while(0)
#define ERRLOGGER(logLevel, stream) do { ErrLogger(logLevel) << stream; } while(0)

#ifdef BUILD_DEBUG
#define LOGGER_DEBUG_BUILD(stream)	LOGGER(Log_DEBUG, stream)
#else // no debug build
#define LOGGER_DEBUG_BUILD(stream)	/* nothing to do if not a debug build */
#endif

/**
 * Note: Log_NORMAL must be lowest level, so that we can test via "if(level > Log_NORMAL)"
 */
enum LogLevel
{
	Log_NORMAL=0,
	Log_VERBOSE=1,
	Log_DEBUG=2,
};

/**
 * Common base for normal and error loggers. Worker threads of concurrent part uploads log through
 * this, so console output is serialized by a single mutex to avoid mixed lines.
 */
class LoggerBase
{
	protected:
		static std::mutex mutex;
		static LogLevel filterLevel; // messages with level higher than this will not be printed
		static bool errToStdout; // true to print error messages to stdout instead of stderr

		LoggerBase() {};

	// inliners
	public:
		/**
		 * @logLevel messages with level higher than this will not be logged.
		 */
		static void setFilterLevel(LogLevel filterLevel)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			LoggerBase::filterLevel = filterLevel;
		}

		/**
		 * Send error messages to stdout, e.g. while a console progress line is active on stderr.
		 */
		static void setErrToStdout(bool errToStdout)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			LoggerBase::errToStdout = errToStdout;
		}

		static void logMsg(LogLevel logLevel, std::string msg)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			if(logLevel > filterLevel)
				return; // nothing to log

			// add timestamp as prefix to normal log msgs only if log level is above normal
			std::string timestampPrefixStr;

			if(filterLevel > Log_NORMAL)
				timestampPrefixStr = getTimestamp() + " ";

			switch(logLevel)
			{
				case Log_VERBOSE: std::cout << timestampPrefixStr << "VERBOSE: " << msg; break;
				case Log_DEBUG: std::cout << timestampPrefixStr << "DEBUG: " << msg; break;
				default: std::cout << timestampPrefixStr << msg;
			}
		}

		static void logErrMsg(LogLevel logLevel, std::string msg)
		{
			std::unique_lock<std::mutex> lock(mutex); // L O C K (scoped)

			if(logLevel > filterLevel)
				return; // nothing to log

			std::string prefixStr;

			switch(logLevel)
			{
				case Log_VERBOSE: prefixStr = "ERROR VERBOSE: "; break;
				case Log_DEBUG: prefixStr = "ERROR DEBUG: "; break;
				default: prefixStr = "ERROR: "; break;
			}

			std::ostream& outStream = errToStdout ? std::cout : std::cerr;

			outStream << getTimestamp() << " " << prefixStr << msg;
		}

	private:
		/**
		 * Returns a short string representing current time of day in the format hh:mm:ss.ms ("ms"
		 * as width 3).
		 */
		static std::string getTimestamp()
		{
			timeval currentTime;
			gettimeofday(&currentTime, NULL);
			int milliSecs = currentTime.tv_usec / 1000;

			char strBuf[16]; // (16 is just long enough for the string)
			struct tm localTime;
			strftime(strBuf, sizeof(strBuf), "%H:%M:%S",
				localtime_r(&currentTime.tv_sec, &localTime) );

			std::string resultStr(strBuf);

			snprintf(strBuf, sizeof(strBuf), ".%03d", milliSecs);

			resultStr += strBuf;

			return resultStr;
		}
};

/**
 * Logger for standard (non-error) messages. Note that messages are only printed in destructor,
 * hence the LOGGER macro.
 */
class Logger : public LoggerBase, public std::ostringstream
{
	public:
		Logger(LogLevel logLevel = Log_NORMAL) : LoggerBase(), logLevel(logLevel) {};

		~Logger()
		{
			if(!this->str().empty() )
				logMsg(logLevel, this->str() );
		}

	private:
		LogLevel logLevel; // level for msg that is being logged now

	// inliners
	public:
		void flush()
		{
			logMsg(logLevel, this->str() );
			this->str(std::string() );
		}
};

/**
 * Logger for error messages. Note that messages are only printed in destructor, hence the ERRLOGGER
 * macro.
 */
class ErrLogger : public LoggerBase, public std::ostringstream
{
	public:
		ErrLogger(LogLevel logLevel = Log_NORMAL) : LoggerBase(), logLevel(logLevel) {};

		~ErrLogger()
		{
			if(!this->str().empty() )
				logErrMsg(logLevel, this->str() );
		}

	private:
		LogLevel logLevel; // level for msg that is being logged now
};

#endif /* LOGGER_H_ */
