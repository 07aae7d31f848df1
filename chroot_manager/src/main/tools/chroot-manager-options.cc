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

#include "src/main/tools/chroot-manager-options.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <getopt.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using std::ifstream;
using std::vector;

static const char *const kDefaultIgnoreList[] = {
    "bash", "sh", "ls", "cat", "echo", "grep", "mount", "umount"};


std::set<std::string> DefaultIgnoreSet() {
  return std::set<std::string>(std::begin(kDefaultIgnoreList),
                               std::end(kDefaultIgnoreList));
}


const char *CommandName(Command command) {
  switch (command) {
    case CMD_CREATE:
      return "create";
    case CMD_CONNECT:
      return "connect";
    case CMD_DISCONNECT:
      return "disconnect";
    case CMD_STATUS:
      return "status";
    case CMD_INSTALL:
      return "install";
    case CMD_UNINSTALL:
      return "uninstall";
    case CMD_HELP:
      return "help";
    case CMD_NONE:
    default:
      return "";
  }
}


bool CommandNeedsRoot(Command command) {
  switch (command) {
    case CMD_CREATE:
    case CMD_CONNECT:
    case CMD_DISCONNECT:
    case CMD_INSTALL:
    case CMD_UNINSTALL:
      return true;
    default:
      return false;
  }
}


static Command CommandFromName(const std::string &name) {
  for (Command c : {CMD_CREATE, CMD_CONNECT, CMD_DISCONNECT, CMD_STATUS,
                    CMD_INSTALL, CMD_UNINSTALL, CMD_HELP}) {
    if (name == CommandName(c)) {
      return c;
    }
  }
  return CMD_NONE;
}


void PrintUsage(const char *program_name) {
  fprintf(stderr,
          "Usage: %s [--verbose] [--daemon] <command>\n"
          "Try '%s help' for more information.\n",
          program_name, program_name);
}


void PrintHelp(const char *program_name) {
  printf(
      "chroot-manager - A chroot management tool\n"
      "\n"
      "Usage:\n"
      "   sudo %s [options] <command>\n"
      "\n"
      "Commands:\n"
      "   create\n"
      "       Create the chroot jail using debootstrap: a minimal Debian\n"
      "       system is installed in the jail root.\n"
      "\n"
      "   connect\n"
      "       Mount dev, proc, sys, tmp and dev/pts into the jail, allow X\n"
      "       connections and enter the chroot. The mounts are removed when\n"
      "       the session ends.\n"
      "       With --daemon the session runs under strace and every system\n"
      "       call of the chroot process and its children is logged, one file\n"
      "       per process, in the trace log directory. Afterwards each file is\n"
      "       renamed to <program>_<pid>.log, logs of trivial commands are\n"
      "       removed, and the directory is handed over to $SUDO_USER.\n"
      "\n"
      "   disconnect\n"
      "       Unmount the filesystems from the jail if any are mounted and\n"
      "       revoke X access.\n"
      "\n"
      "   status\n"
      "       Display the current mounts of the jail.\n"
      "\n"
      "   install\n"
      "       Install chroot_manager to /usr/local/bin, along with the man\n"
      "       page and bash completion found in the current directory.\n"
      "\n"
      "   uninstall\n"
      "       Remove chroot_manager, its man page and bash completion.\n"
      "\n"
      "   help\n"
      "       Display this detailed help message.\n"
      "\n"
      "Options:\n"
      "   -v, --verbose        print debug messages on the console as well\n"
      "   -d, --daemon         with connect, trace the session with strace\n"
      "   -r, --root DIR       jail root (default: " DEFAULT_JAIL_ROOT ")\n"
      "   -m, --mirror URL     Debian mirror (default: " DEFAULT_MIRROR ")\n"
      "   -s, --suite NAME     Debian suite (default: " DEFAULT_SUITE ")\n"
      "   -l, --log-dir DIR    trace log directory (default: ./" DAEMON_LOG_DIR_NAME ")\n"
      "   -L, --log-file FILE  log file (default: " DEFAULT_LOG_FILE ")\n"
      "   -i, --ignore NAME    also drop trace logs of program NAME\n"
      "   -V, --version        print version information and quit\n"
      "   -h, --help           this help\n"
      "   @FILE                read newline-separated arguments from FILE\n"
      "\n"
      "Notes:\n"
      "   create, connect, disconnect, install and uninstall must run as root;\n"
      "   when started by another user the tool re-executes itself with\n"
      "   'sudo -E'.\n",
      program_name);
}


// Print out a usage error. fmt is a format string for the error message to
// print.
static void Usage(const char *program_name, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

static void Usage(const char *program_name, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);
  fprintf(stderr, "\n");
  PrintUsage(program_name);
}


static std::string AbsolutePath(const std::string &path) {
  fs::path p(path);
  if (p.is_relative()) {
    p = fs::path(GetCurrentWorkingDirectory()) / p;
  }
  std::string res = p.lexically_normal().string();
  while (res.size() > 1 && res.back() == '/') {
    res.pop_back();
  }
  return res;
}


// Expands a single argument, expanding options @filename to read in the content
// of the file and add it to the list of processed arguments.
static bool ExpandArgument(vector<std::string> *expanded, const std::string &arg) {
  if (arg.size() > 1 && arg[0] == '@') {
    const std::string filename = arg.substr(1);  // strip off the '@'.
    ifstream f(filename);

    if (!f.is_open()) {
      fprintf(stderr, "opening argument file %s failed\n", filename.c_str());
      return false;
    }

    for (std::string line; std::getline(f, line);) {
      if (!line.empty()) {
        if (!ExpandArgument(expanded, line))
          return false;
      }
    }

    if (f.bad()) {
      fprintf(stderr, "error while reading from argument file %s\n",
              filename.c_str());
      return false;
    }
  } else {
    expanded->push_back(arg);
  }

  return true;
}


// Pre-processes an argument list, expanding options @filename to read in the
// content of the file and add it to the list of arguments. Stops expanding
// arguments once it encounters "--".
static bool ExpandArguments(const vector<std::string> &args,
                            vector<std::string> *expanded) {
  expanded->reserve(args.size());
  for (auto arg = args.begin(); arg != args.end(); ++arg) {
    if (*arg != "--") {
      if (!ExpandArgument(expanded, *arg))
        return false;
    } else {
      expanded->insert(expanded->end(), arg, args.end());
      break;
    }
  }
  return true;
}


// Parses command line flags from an argv array and puts the results into an
// Options structure passed in as an argument.
static ParseResult ParseCommandLine(vector<std::string> &args, Options *opt) {
  static const struct option long_options[] = {
      {"verbose", no_argument, nullptr, 'v'},
      {"daemon", no_argument, nullptr, 'd'},
      {"root", required_argument, nullptr, 'r'},
      {"mirror", required_argument, nullptr, 'm'},
      {"suite", required_argument, nullptr, 's'},
      {"log-dir", required_argument, nullptr, 'l'},
      {"log-file", required_argument, nullptr, 'L'},
      {"ignore", required_argument, nullptr, 'i'},
      {"version", no_argument, nullptr, 'V'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(nullptr);
  const int argc = static_cast<int>(args.size());
  const char *program_name = argv[0];

  // Reinitialize getopt, we may be called more than once.
  optind = 0;
  opterr = 0;
  int c;
  while ((c = getopt_long(argc, argv.data(), ":vdr:m:s:l:L:i:Vh",
                          long_options, nullptr)) != -1) {
    switch (c) {
      case 'v':
        opt->verbose = true;
        break;
      case 'd':
        opt->daemon = true;
        break;
      case 'r':
        if (optarg[0] == '\0') {
          Usage(program_name, "The jail root (-r) can't be empty.");
          return PARSE_ERROR;
        }
        opt->jail_root = AbsolutePath(optarg);
        break;
      case 'm':
        opt->mirror.assign(optarg);
        break;
      case 's':
        opt->suite.assign(optarg);
        break;
      case 'l':
        if (optarg[0] == '\0') {
          Usage(program_name, "The trace log directory (-l) can't be empty.");
          return PARSE_ERROR;
        }
        opt->trace_log_dir = AbsolutePath(optarg);
        break;
      case 'L':
        opt->log_file.assign(optarg);
        break;
      case 'i':
        if (strchr(optarg, '/') != nullptr) {
          Usage(program_name, "Ignored programs (-i) are basenames: %s", optarg);
          return PARSE_ERROR;
        }
        opt->ignore_set.insert(optarg);
        break;
      case 'V':
        opt->print_version = true;
        return PARSE_EXIT_SUCCESS;
      case 'h':
        PrintHelp(program_name);
        return PARSE_EXIT_SUCCESS;
      case ':':
        Usage(program_name, "Option %s requires an argument",
              argv[optind - 1]);
        return PARSE_ERROR;
      case '?':
      default:
        Usage(program_name, "Unknown option or command: %s", argv[optind - 1]);
        return PARSE_ERROR;
    }
  }

  // getopt_long moved all non-options to the end.
  for (int i = optind; i < argc; ++i) {
    if (strcmp(argv[i], "--") == 0) {
      continue;
    }
    Command command = CommandFromName(argv[i]);
    if (command == CMD_NONE || opt->command != CMD_NONE) {
      Usage(program_name, "Unknown option or command: %s", argv[i]);
      return PARSE_ERROR;
    }
    opt->command = command;
  }

  if (opt->command == CMD_NONE) {
    Usage(program_name, "Invalid command.");
    return PARSE_ERROR;
  }
  return PARSE_OK;
}


ParseResult ParseOptions(int argc, char *argv[], Options *opt) {
  vector<std::string> args(argv, argv + argc);
  opt->original_args = args;
  opt->ignore_set = DefaultIgnoreSet();

  if (argc < 2) {
    PrintUsage(argc > 0 ? argv[0] : "chroot-manager");
    return PARSE_ERROR;
  }

  vector<std::string> expanded;
  if (!ExpandArguments(args, &expanded)) {
    PrintUsage(argv[0]);
    return PARSE_ERROR;
  }

  ParseResult res = ParseCommandLine(expanded, opt);
  if (res != PARSE_OK) {
    return res;
  }

  if (opt->trace_log_dir.empty()) {
    opt->trace_log_dir = AbsolutePath(DAEMON_LOG_DIR_NAME);
  }
  return PARSE_OK;
}
