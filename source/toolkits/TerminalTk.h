// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_TERMINALTK_H_
#define TOOLKITS_TERMINALTK_H_

#include <cstdint>
#include <string>

#define CONTROLCHARS_CLEARLINE_AND_CARRIAGERETURN	"\x1B[2K\r" /* "\x1B[2K" is the VT100 code to
										clear the line. "\r" moves cursor to beginning of line. */

#define TERMINALTK_PROGRESSBAR_WIDTH	30 // number of chars between the brackets


/**
 * Toolkit for the single-line console progress display of the command line client.
 */
class TerminalTk
{
	public:
		static bool isStdoutTTY();
		static int getTerminalLineLength(int defaultLen=0);
		static bool disableConsoleBuffering();
		static bool resetConsoleBuffering();
		static bool rewriteConsoleLine(std::string lineStr);
		static bool clearConsoleLine();
		static std::string makeProgressLine(double percent, uint64_t numBytesDone,
			uint64_t numBytesTotal, uint64_t elapsedMS);

	private:
		TerminalTk() {}
};



#endif /* TOOLKITS_TERMINALTK_H_ */
