// Copyright 2015 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_LOGGING_H_
#define SRC_MAIN_TOOLS_LOGGING_H_

#include <stdio.h>

#include <string>

enum LogLevel { LOG_LEVEL_DEBUG, LOG_LEVEL_INFO, LOG_LEVEL_ERROR };

// Every message is appended here, whatever its level. May be nullptr, in which
// case messages only reach the console.
extern FILE *global_debug;

// If set, DEBUG messages are printed on the console too.
extern bool global_verbose;

void LogMessage(LogLevel level, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#define PRINT_DEBUG(fmt, ...) LogMessage(LOG_LEVEL_DEBUG, fmt, ##__VA_ARGS__)
#define PRINT_INFO(fmt, ...) LogMessage(LOG_LEVEL_INFO, fmt, ##__VA_ARGS__)
#define PRINT_ERROR(fmt, ...) LogMessage(LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)

// Opens `path` in append mode as the persistent log. Returns false if the file
// can't be opened; logging then continues on the console only.
bool OpenLog(const std::string &path);
void CloseLog();

// Dumps kernel, OS and C/C++ runtime versions at DEBUG level.
void logSystem();

#endif  // SRC_MAIN_TOOLS_LOGGING_H_
