// SPDX-FileCopyrightText: 2020-2025 Sven Breuner and elbencho contributors
// SPDX-License-Identifier: GPL-3.0-only

#include "Logger.h"

std::mutex LoggerBase::mutex;
LogLevel LoggerBase::filterLevel = Log_NORMAL;
bool LoggerBase::errToStdout = false;
