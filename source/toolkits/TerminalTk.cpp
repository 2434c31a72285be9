// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
#include "toolkits/TerminalTk.h"
#include "toolkits/UnitTk.h"

/**
 * Check if stdout is a tty. Intended to find out if the progress line can be enabled.
 *
 * @return true if stdout is a tty (and this is likely to understand special codes to erase line).
 */
bool TerminalTk::isStdoutTTY()
{
	if(isatty(fileno(stdout) ) == 1)
		return true;

	return false;
}

/**
 * Get length (columns) of terminal.
 *
 * @defaultLen The value to be returned if terminal line length cannot be retrieved.
 * @return If terminal line length cannot be retrieved (e.g. because output is not a terminal) then
 * 		defaultLen will be returned.
 */
int TerminalTk::getTerminalLineLength(int defaultLen)
{
	struct winsize consoleSize;

	int ioctlRes = ioctl(STDOUT_FILENO, TIOCGWINSZ, &consoleSize);

	if(ioctlRes == -1)
		return defaultLen;

	return consoleSize.ws_col;
}

/**
 * Disable stdout buffering while the progress line is shown.
 *
 * @return true on success (if console is not a tty, then this is also counted as success).
 */
bool TerminalTk::disableConsoleBuffering()
{
	if(!isStdoutTTY() )
		return true; // stdout might be a file

	int setBufRes = setvbuf(stdout, NULL, _IONBF, 0);

	return setBufRes ? false : true;
}

/**
 * Re-enable line buffering after the progress line is done.
 *
 * @return true on success (if console is not a tty, then this is also counted as success).
 */
bool TerminalTk::resetConsoleBuffering()
{
	if(!isStdoutTTY() )
		return true; // stdout might be a file

	int setBufRes = setvbuf(stdout, NULL, _IOLBF, 0);

	return setBufRes ? false : true;
}

/**
 * Erase the contents of the current console line and write the new given line. The given line
 * must not end with a newline and will get trimmed to the console width.
 *
 * This is a no-op if stdout is not a TTY.
 *
 * @return always true, just so that this can be used as "noProgressLine || rewriteLine()"
 */
bool TerminalTk::rewriteConsoleLine(std::string lineStr)
{
	if(!isStdoutTTY() )
		return true; // stdout might be a file

	// check console size to handle console resize at runtime

	int terminalLineLen = getTerminalLineLength();
	if(terminalLineLen < 3)
		return true; // don't cancel upload just because we can't show progress

	// note: "-2" for "^C" printed when user presses ctrl+c
	unsigned usableLineLen = terminalLineLen - 2;

	if(lineStr.length() > usableLineLen)
		lineStr.resize(usableLineLen);

	std::cout << CONTROLCHARS_CLEARLINE_AND_CARRIAGERETURN << lineStr << std::flush;

	return true;
}

/**
 * Erase the current line and move cursor back to beginning of erased line.
 *
 * @return see rewriteConsoleLine().
 */
bool TerminalTk::clearConsoleLine()
{
	return rewriteConsoleLine(std::string() );
}

/**
 * Format a progress line like this:
 * "[#########                     ]  30.0% 1.2GiB / 4.0GiB @ 85.3MiB/s; Elapsed: 14s"
 */
std::string TerminalTk::makeProgressLine(double percent, uint64_t numBytesDone,
	uint64_t numBytesTotal, uint64_t elapsedMS)
{
	if(percent < 0)
		percent = 0;
	else
	if(percent > 100)
		percent = 100;

	const unsigned numFilledChars = (percent * TERMINALTK_PROGRESSBAR_WIDTH) / 100;

	std::ostringstream stream;

	stream << "[" << std::string(numFilledChars, '#') <<
		std::string(TERMINALTK_PROGRESSBAR_WIDTH - numFilledChars, ' ') << "] " <<
		std::fixed << std::setprecision(1) << std::setw(5) << percent << "% " <<
		UnitTk::bytesToHumanStrBinary(numBytesDone) << " / " <<
		UnitTk::bytesToHumanStrBinary(numBytesTotal) << " @ " <<
		UnitTk::bytesToHumanStrBinary(UnitTk::getPerSecFromMS(numBytesDone, elapsedMS) ) <<
		"/s; Elapsed: " << UnitTk::elapsedSecToHumanStr(elapsedMS / 1000);

	return stream.str();
}
