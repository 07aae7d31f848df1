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

#ifndef SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
#define SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

#include <stdbool.h>
#include <sys/types.h>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

struct utsname;

// Set up a signal handler for a signal.
void InstallSignalHandler(int signum, void (*handler)(int));

// Set the signal handler for `signum` to SIG_IGN (ignore).
void IgnoreSignal(int signum);

// Set the signal handler for `signum` to SIG_DFL (default).
void InstallDefaultSignalHandler(int sig);

// Use an empty signal mask for the process and set all signal handlers to their
// default.
void ClearSignalMask();

// Records SIGINT, SIGTERM and SIGHUP instead of dying on them, and hangs up
// the foreground session (if any) on SIGTERM and SIGHUP. Also ignores SIGTTIN
// and SIGTTOU so that the terminal can be taken back from the session.
void InstallTerminationHandlers();

// Returns the last termination signal received, or 0.
int TerminationSignal();
bool TerminationRequested();

// Forks and execs `args` in its own process group which gets the terminal's
// foreground. Returns 0 and sets `child_pid` on success. If the program could
// not be executed, the child has already been reaped, `exec_errno` holds the
// reason and -1 is returned.
int SpawnForegroundChild(const std::vector<std::string>& args, pid_t* child_pid,
                         int* exec_errno);

// Waits for `pid`, restarting on EINTR, gives the terminal back to our process
// group and returns the child's exit code (128 + signal if it was killed).
// Returns -1 if waiting failed.
int WaitForChild(pid_t pid);

enum class ErrorCode : int;

// SpawnForegroundChild followed by WaitForChild. A program that can't be
// started is reported with `launch_error`; otherwise returns 0 and stores the
// program's exit code into `exit_status`.
int RunForegroundCommand(const std::vector<std::string>& args,
                         ErrorCode launch_error, int* exit_status);

// Runs `args` to completion. When `input` is set it's written to the child's
// stdin; when `output` is set the child's stdout is captured into it. Returns
// the exit code of the command, 127 if it couldn't be executed, or -1 if it
// couldn't be started at all.
int RunCommand(const std::vector<std::string>& args, const std::string* input,
               std::string* output);

// Equivalent of `command -v`: searches $PATH for an executable `name`.
bool CommandExists(const std::string& name);

// Holds an exclusive flock() on a file for its lifetime. The file is created
// if needed and stays in place after release, so every contender locks the
// same inode.
class ScopedFileLock {
 public:
  ScopedFileLock() : fd_(-1) {}
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  // Returns 0 on success, 1 if another process holds the lock, -1 on error
  // (errno is set).
  int TryLock(const std::string& path);
  void Release();
  bool locked() const { return fd_ >= 0; }

 private:
  int fd_;
  std::string path_;
};

int CreateDirectories(const std::string& base_path);
std::string GetCurrentWorkingDirectory();
bool isSubpath(const fs::path &base, const fs::path &sub);

// Resolves `path` through symlinks when it exists, lexically otherwise.
std::string CanonicPath(const std::string& path);

// The user that invoked us through sudo, or an empty string.
std::string GetInvokingUser();
std::string GetSelfExecutable();

bool GetOSName(std::string& printable_name, std::string& version_id);
bool GetKernelInfo(struct utsname* buf);

#endif  // SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
