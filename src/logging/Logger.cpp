//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state; the initial level comes from TOOLHOST_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
