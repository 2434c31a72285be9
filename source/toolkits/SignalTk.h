// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#ifndef TOOLKITS_SIGNALTK_H_
#define TOOLKITS_SIGNALTK_H_

#include <csignal>
#include <string>
#include <unistd.h>


class SignalTk
{
	public:
		static bool blockInterruptSignals(sigset_t* outOldSignalMask = NULL);
		static bool restoreSignalMask(const sigset_t& oldSignalMask);
		static int waitForInterruptSignal(unsigned timeoutMS);

	private:
		SignalTk() {}
};


#endif /* TOOLKITS_SIGNALTK_H_ */
