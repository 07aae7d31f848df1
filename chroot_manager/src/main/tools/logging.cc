// Copyright 2017 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <stdarg.h>
#include <sys/utsname.h>
#include <time.h>
#include <gnu/libc-version.h>
#include <string>
#include <vector>
#include <stdexcept>


FILE *global_debug = nullptr;
bool global_verbose = false;


static const char *LevelTag(LogLevel level) {
  switch (level) {
    case LOG_LEVEL_DEBUG:
      return "DEBUG";
    case LOG_LEVEL_INFO:
      return "INFO";
    case LOG_LEVEL_ERROR:
    default:
      return "ERROR";
  }
}


void LogMessage(LogLevel level, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  int size = vsnprintf(nullptr, 0, fmt, args);
  va_end(args);
  if (size < 0) {
    return;
  }

  std::vector<char> buffer(size + 1);
  va_start(args, fmt);
  vsnprintf(buffer.data(), buffer.size(), fmt, args);
  va_end(args);

  char stamp[32] = {0};
  time_t now = time(nullptr);
  struct tm local;
  if (localtime_r(&now, &local) != nullptr) {
    strftime(stamp, sizeof(stamp), "%F %T", &local);
  }

  if (global_debug != nullptr) {
    fprintf(global_debug, "[%s] %s %s\n", LevelTag(level), stamp,
            buffer.data());
    fflush(global_debug);
  }

  if (level == LOG_LEVEL_ERROR) {
    fprintf(stderr, "[%s] %s %s\n", LevelTag(level), stamp, buffer.data());
  } else if (level == LOG_LEVEL_INFO || global_verbose) {
    fprintf(stdout, "[%s] %s %s\n", LevelTag(level), stamp, buffer.data());
    fflush(stdout);
  }
}


bool OpenLog(const std::string &path) {
  if (global_debug != nullptr) {
    return true;
  }
  global_debug = fopen(path.c_str(), "a");
  if (global_debug == nullptr) {
    fprintf(stderr, "Warning: could not open log file %s: %m\n", path.c_str());
    return false;
  }
  return true;
}


void CloseLog() {
  if (global_debug != nullptr) {
    fclose(global_debug);
    global_debug = nullptr;
  }
}


void logOSKernel() {
  struct utsname buf;
  bool res = GetKernelInfo(&buf);
  if (res) {
    PRINT_DEBUG("OS: %s", buf.sysname);
    PRINT_DEBUG("Kernel: %s", buf.release);
    PRINT_DEBUG("Version: %s", buf.version);
    PRINT_DEBUG("Machine: %s", buf.machine);
  } else {
    PRINT_DEBUG("uname failed: %m");
  }
}


void logLibc() {
  PRINT_DEBUG("libc: %s", gnu_get_libc_version());
}


void logLibstdcpp() {
#ifdef _GLIBCXX_RELEASE
    PRINT_DEBUG("libstdc++ release: %d", _GLIBCXX_RELEASE);
#endif

#ifdef __GLIBCXX__
    PRINT_DEBUG("__GLIBCXX__: %d", __GLIBCXX__);
#endif
}


void logOSName() {
  try {
    std::string pretty, version;
    const bool ok = GetOSName(pretty, version);

    if (!ok) {
      PRINT_DEBUG("Can't log OS info: /etc/os-release missing or keys not found");
      return;
    }

    if (!pretty.empty()) {
      PRINT_DEBUG("OS PRETTY_NAME: %s", pretty.c_str());
    } else {
      PRINT_DEBUG("OS PRETTY_NAME not found");
    }

    if (!version.empty()) {
      PRINT_DEBUG("OS VERSION_ID: %s", version.c_str());
    } else {
      PRINT_DEBUG("OS VERSION_ID not found");
    }
  } catch (const std::exception& e) {
    PRINT_DEBUG("Can't log OS info (exception): %s", e.what());
  }
}


void logSystem() {
  logOSKernel();
  logOSName();
  logLibc();
  logLibstdcpp();
}
