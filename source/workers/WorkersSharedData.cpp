// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include "WorkersSharedData.h"


/**
 * Remember the error of the first failing worker and cancel all others. Errors of later failing
 * workers are only logged by themselves, because they are usually consequences of the first one.
 */
void WorkersSharedData::setFirstErrorUnlocked(std::exception_ptr errorPtr, unsigned partNumber)
{
	if(!firstErrorPtr)
	{
		firstErrorPtr = errorPtr;
		firstErrorPartNumber = partNumber;
	}

	interruptWorkersUnlocked(false);
}
