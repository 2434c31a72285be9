// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <exception>
#include "Coordinator.h"
#include "Logger.h"
#include "ProgArgs.h"

/**
 * Parse command line args, check if we just need to print help and otherwise leave the rest to the
 * Coordinator class.
 */
int main(int argc, char** argv)
{
	try
	{
		ProgArgs progArgs(argc, argv);

		if(progArgs.hasUserRequestedHelp() )
		{
			progArgs.printHelp();
			return EXIT_SUCCESS;
		}

		if(progArgs.hasUserRequestedVersion() )
		{
			progArgs.printVersionAndBuildInfo();
			return EXIT_SUCCESS;
		}

		// print original command line

		Logger cmdLog(Log_VERBOSE);
		cmdLog << "COMMAND LINE: ";
		for(int i=0; i < argc; i++)
			cmdLog << "\"" << argv[i] << "\" ";

		cmdLog << std::endl;
		cmdLog.flush();

		return Coordinator(progArgs).main();
	}
	catch(std::exception& e)
	{
		ErrLogger() << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
