// Copyright 2016 The Bazel Authors. All rights reserved.
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

#ifndef SRC_MAIN_TOOLS_CHROOT_MANAGER_OPTIONS_H_
#define SRC_MAIN_TOOLS_CHROOT_MANAGER_OPTIONS_H_

#include <stdbool.h>
#include <stddef.h>

#include <set>
#include <string>
#include <vector>

#define DEFAULT_JAIL_ROOT "/var/chroot"
#define DEFAULT_MIRROR "http://deb.debian.org/debian"
#define DEFAULT_SUITE "stable"
#define DEFAULT_LOG_FILE "/var/log/chroot_manager.log"
#define DAEMON_LOG_DIR_NAME "chroot_daemon_logs"

#define INSTALL_BIN_PATH "/usr/local/bin/chroot_manager"
#define INSTALL_MAN_DIR "/usr/local/share/man/man1"
#define MAN_PAGE_NAME "chroot_manager.1"
#define BASH_COMPLETION_NAME "chroot_manager.bash_completion"
#define INSTALL_BASH_COMPLETION_PATH "/etc/bash_completion.d/chroot_manager"

// Set before re-executing through `sudo -E` so that we don't loop.
#define ENV_PRESERVED_MARKER "_CHROOT_MANAGER_ENV_PRESERVED"

enum Command {
  CMD_NONE,
  CMD_CREATE,
  CMD_CONNECT,
  CMD_DISCONNECT,
  CMD_STATUS,
  CMD_INSTALL,
  CMD_UNINSTALL,
  CMD_HELP
};

// Options parsing result.
struct Options {
  Command command = CMD_NONE;
  // The chroot jail root directory (-r)
  std::string jail_root = DEFAULT_JAIL_ROOT;
  // Debian mirror used by create (-m)
  std::string mirror = DEFAULT_MIRROR;
  // Debian suite used by create (-s)
  std::string suite = DEFAULT_SUITE;
  // Where strace writes the per-process logs (-l)
  std::string trace_log_dir;
  // Persistent log of everything we print (-L)
  std::string log_file = DEFAULT_LOG_FILE;
  // Print debugging messages on the console (-v)
  bool verbose = false;
  // Run the connect session under strace (-d)
  bool daemon = false;
  // Basenames of programs whose trace logs are dropped (-i adds more)
  std::set<std::string> ignore_set;
  // Print the version and exit (-V)
  bool print_version = false;
  // The arguments we were started with, for re-executing through sudo
  std::vector<std::string> original_args;
};

enum ParseResult { PARSE_OK = 0, PARSE_EXIT_SUCCESS = 1, PARSE_ERROR = -1 };

// Parses all command line flags into `opt`. On PARSE_ERROR the reason and the
// short usage were already printed; PARSE_EXIT_SUCCESS means help or version
// output was requested and printed.
ParseResult ParseOptions(int argc, char *argv[], Options *opt);

std::set<std::string> DefaultIgnoreSet();
const char *CommandName(Command command);

// Whether `command` changes host state and so needs root.
bool CommandNeedsRoot(Command command);

void PrintUsage(const char *program_name);
void PrintHelp(const char *program_name);

#endif  // SRC_MAIN_TOOLS_CHROOT_MANAGER_OPTIONS_H_
