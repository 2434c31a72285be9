// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include "ProgException.h"
#include "toolkits/SignalTk.h"


/**
 * Block SIGINT/SIGTERM signals for the calling pthread.
 *
 * Linux can direct a process-directed signal to any thread that doesn't block it. So this is to
 * ensure that only the main thread and not other threads receive a SIGINT, e.g. if a user presses
 * ctrl+c.
 *
 * A new thread inherits a copy of its creator's signal mask.
 *
 * @outOldSignalMask previous mask of the calling thread for restoreSignalMask(); can be NULL.
 */
bool SignalTk::blockInterruptSignals(sigset_t* outOldSignalMask)
{
	sigset_t signalMask; // mask of signals to block

	sigemptyset(&signalMask);

	sigaddset(&signalMask, SIGINT);
	sigaddset(&signalMask, SIGTERM);

	int sigmaskRes = pthread_sigmask(SIG_BLOCK, &signalMask, outOldSignalMask);

	return (sigmaskRes == 0);
}

/**
 * Restore the signal mask of the calling thread from before blockInterruptSignals(). Signals stay
 * blocked if they were already blocked before, e.g. in a thread that was started by a caller that
 * waits for signals synchronously.
 */
bool SignalTk::restoreSignalMask(const sigset_t& oldSignalMask)
{
	int sigmaskRes = pthread_sigmask(SIG_SETMASK, &oldSignalMask, NULL);

	return (sigmaskRes == 0);
}

/**
 * Synchronously wait for SIGINT/SIGTERM. The signals must be blocked in all threads via
 * blockInterruptSignals(), otherwise the default handler terminates the process first.
 *
 * @timeoutMS max time to wait.
 * @return received signal number or 0 on timeout.
 * @throw ProgException on unexpected error.
 */
int SignalTk::waitForInterruptSignal(unsigned timeoutMS)
{
	sigset_t signalMask;

	sigemptyset(&signalMask);

	sigaddset(&signalMask, SIGINT);
	sigaddset(&signalMask, SIGTERM);

	struct timespec timeout;
	timeout.tv_sec = timeoutMS / 1000;
	timeout.tv_nsec = (timeoutMS % 1000) * 1000 * 1000;

	int waitRes = sigtimedwait(&signalMask, NULL, &timeout);

	if(waitRes != -1)
		return waitRes;

	if( (errno == EAGAIN) || (errno == EINTR) )
		return 0;

	throw ProgException(std::string("Waiting for interrupt signal failed. ") +
		"SysErr: " + strerror(errno) );
}
