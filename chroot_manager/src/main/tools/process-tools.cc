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

#include "src/main/tools/process-tools.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#ifndef TEMP_FAILURE_RETRY
// Some C standard libraries like musl do not define this macro, so we'll
// include our own version for compatibility.
#define TEMP_FAILURE_RETRY(exp)                                                \
  ({                                                                           \
    decltype(exp) _rc;                                                         \
    do {                                                                       \
      _rc = (exp);                                                             \
    } while (_rc == -1 && errno == EINTR);                                     \
    _rc;                                                                       \
  })
#endif  // TEMP_FAILURE_RETRY

#define DEFAULT_PATH "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin"

// The process group leader of the foreground session, for use in signal
// handlers.
static std::atomic<pid_t> global_child_pid{0};
static volatile sig_atomic_t global_termination_signal = 0;

static_assert(std::atomic<pid_t>::is_always_lock_free);

void InstallSignalHandler(int signum, void (*handler)(int)) {
  struct sigaction sa = {};
  sa.sa_handler = handler;
  if (handler == SIG_IGN || handler == SIG_DFL) {
    // No point in blocking signals when using the default handler or ignoring
    // the signal.
    if (sigemptyset(&sa.sa_mask) < 0) {
      ChrootMgrReport("sigemptyset: %m");
    }
  } else {
    // When using a custom handler, block all signals from firing while the
    // handler is running.
    if (sigfillset(&sa.sa_mask) < 0) {
      ChrootMgrReport("sigfillset: %m");
    }
  }
  // sigaction may fail for certain reserved signals. Ignore failure in this
  // case, but report it in debug mode, just in case.
  if (sigaction(signum, &sa, nullptr) < 0) {
    PRINT_DEBUG("sigaction(%d, &sa, nullptr) failed", signum);
  }
}

void IgnoreSignal(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_IGN);
  }
}

void InstallDefaultSignalHandler(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_DFL);
  }
}


void ClearSignalMask() {
  // Use an empty signal mask for the process.
  sigset_t empty_sset;
  if (sigemptyset(&empty_sset) < 0) {
    ChrootMgrReport("sigemptyset: %m");
  }
  if (sigprocmask(SIG_SETMASK, &empty_sset, nullptr) < 0) {
    ChrootMgrReport("sigprocmask: %m");
  }

  // Set the default signal handler for all signals.
  for (int i = 1; i < NSIG; ++i) {
    if (i == SIGKILL || i == SIGSTOP) {
      continue;
    }

    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    if (sigemptyset(&sa.sa_mask) < 0) {
      ChrootMgrReport("sigemptyset: %m");
    }
    // Ignore possible errors, because we might not be allowed to set the
    // handler for certain signals, but we still want to try.
    sigaction(i, &sa, nullptr);
  }
}


static void OnTermination(int signum) {
  global_termination_signal = signum;

  // SIGINT already reached the foreground session through the terminal.
  if (signum == SIGINT) {
    return;
  }

  // Interactive shells ignore SIGTERM, so hang up the whole session instead.
  const pid_t child_pid = global_child_pid.load(std::memory_order_relaxed);
  if (child_pid > 0) {
    kill(-child_pid, SIGHUP);
  }
}


void InstallTerminationHandlers() {
  InstallSignalHandler(SIGINT, OnTermination);
  InstallSignalHandler(SIGTERM, OnTermination);
  InstallSignalHandler(SIGHUP, OnTermination);

  // We hand off the terminal to the session and take it back afterwards.
  IgnoreSignal(SIGTTIN);
  IgnoreSignal(SIGTTOU);
}


int TerminationSignal() { return global_termination_signal; }

bool TerminationRequested() { return global_termination_signal != 0; }


static std::vector<char *> ToArgv(const std::vector<std::string>& args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  // argv[] passed to execve() must be a null-terminated array.
  argv.push_back(nullptr);
  return argv;
}


static std::string JoinArgs(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty())
      joined += " ";
    joined += arg;
  }
  return joined;
}


// Reaps `pid` and converts its status to a shell-like exit code.
static int ReapChild(pid_t pid) {
  int status;
  while (true) {
    const pid_t ret = waitpid(pid, &status, 0);
    if (ret == pid) {
      break;
    }
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    return ChrootMgrReport("waitpid(%d): %m", pid);
  }

  // We want to report the exit in the same manner as a shell would.
  if (WIFSIGNALED(status)) {
    const int signal = WTERMSIG(status);
    PRINT_DEBUG("child %d exited due to receiving signal: %s", pid,
                strsignal(signal));
    return 128 + signal;
  }

  const int exit_code = WEXITSTATUS(status);
  PRINT_DEBUG("child %d exited normally with code %d", pid, exit_code);
  return exit_code;
}


static void ReportExecFailureAndExit(int fd) {
  int err = errno;
  if (write(fd, &err, sizeof(err)) < 0) {
    // Nothing left to tell the parent with.
  }
  _exit(127);
}


int SpawnForegroundChild(const std::vector<std::string>& args,
                         pid_t* child_pid, int* exec_errno) {
  if (args.empty()) {
    return ChrootMgrReport("%s: empty command line", __func__);
  }

  // Written by the child only if exec fails, closed by exec otherwise.
  int exec_pipe[2];
  if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
    return ChrootMgrReport("pipe2: %m");
  }

  std::vector<char *> argv = ToArgv(args);
  PRINT_DEBUG("calling fork for '%s'...", JoinArgs(args).c_str());
  const pid_t pid = fork();

  if (pid < 0) {
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    return ChrootMgrReport("fork: %m");
  } else if (pid == 0) {
    close(exec_pipe[0]);

    // Put the child into its own process group.
    if (setpgid(0, 0) < 0) {
      ReportExecFailureAndExit(exec_pipe[1]);
    }

    // Try to assign our terminal to the child process.
    if (tcsetpgrp(STDIN_FILENO, getpgrp()) < 0 && errno != ENOTTY &&
        errno != EBADF) {
      ReportExecFailureAndExit(exec_pipe[1]);
    }

    // Unblock all signals, restore default handlers.
    ClearSignalMask();

    // Close the file PRINT_DEBUG writes to.
    if (global_debug) {
      fclose(global_debug);
      global_debug = nullptr;
    }

    execvp(argv[0], argv.data());
    ReportExecFailureAndExit(exec_pipe[1]);
  }

  close(exec_pipe[1]);

  // Also done in the child; whichever runs first wins.
  if (setpgid(pid, pid) < 0 && errno != EACCES) {
    PRINT_DEBUG("setpgid(%d): %m", pid);
  }
  global_child_pid.store(pid, std::memory_order_relaxed);

  int child_errno = 0;
  const ssize_t n = TEMP_FAILURE_RETRY(
      read(exec_pipe[0], &child_errno, sizeof(child_errno)));
  close(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    *exec_errno = child_errno;
    WaitForChild(pid);
    return -1;
  }

  PRINT_DEBUG("child started with PID %d", pid);
  *child_pid = pid;
  return 0;
}


int WaitForChild(pid_t pid) {
  const int exit_code = ReapChild(pid);
  global_child_pid.store(0, std::memory_order_relaxed);

  // Take the terminal back; SIGTTOU is ignored so this can't stop us.
  if (isatty(STDIN_FILENO) && tcsetpgrp(STDIN_FILENO, getpgrp()) < 0) {
    PRINT_DEBUG("tcsetpgrp: %m");
  }
  return exit_code;
}


int RunForegroundCommand(const std::vector<std::string>& args,
                         ErrorCode launch_error, int* exit_status) {
  if (args.empty()) {
    return ChrootMgrReport("%s: empty command line", __func__);
  }

  pid_t pid = 0;
  int exec_errno = 0;
  if (SpawnForegroundChild(args, &pid, &exec_errno) < 0) {
    std::string err = args[0];
    if (exec_errno != 0) {
      err += ": ";
      err += strerror(exec_errno);
    }
    return ChrootMgrReportErrorAndMessage(err, launch_error);
  }

  const int exit_code = WaitForChild(pid);
  if (exit_code < 0) {
    return exit_code;
  }
  *exit_status = exit_code;
  return 0;
}


static bool WriteAll(int fd, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = TEMP_FAILURE_RETRY(
        write(fd, data.data() + written, data.size() - written));
    if (n < 0) {
      return false;
    }
    written += n;
  }
  return true;
}


int RunCommand(const std::vector<std::string>& args, const std::string* input,
               std::string* output) {
  if (args.empty()) {
    return ChrootMgrReport("%s: empty command line", __func__);
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (input != nullptr && pipe2(in_pipe, O_CLOEXEC) < 0) {
    return ChrootMgrReport("pipe2: %m");
  }
  if (output != nullptr && pipe2(out_pipe, O_CLOEXEC) < 0) {
    if (input != nullptr) {
      close(in_pipe[0]);
      close(in_pipe[1]);
    }
    return ChrootMgrReport("pipe2: %m");
  }

  std::vector<char *> argv = ToArgv(args);
  PRINT_DEBUG("running '%s'", JoinArgs(args).c_str());
  const pid_t pid = fork();

  if (pid < 0) {
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
      if (fd >= 0)
        close(fd);
    }
    return ChrootMgrReport("fork: %m");
  } else if (pid == 0) {
    ClearSignalMask();
    if (input != nullptr && dup2(in_pipe[0], STDIN_FILENO) < 0) {
      _exit(127);
    }
    if (output != nullptr && dup2(out_pipe[1], STDOUT_FILENO) < 0) {
      _exit(127);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }

  if (input != nullptr) {
    close(in_pipe[0]);
    // The command may exit without reading everything.
    IgnoreSignal(SIGPIPE);
    if (!WriteAll(in_pipe[1], *input)) {
      PRINT_DEBUG("short write to '%s': %m", args[0].c_str());
    }
    InstallDefaultSignalHandler(SIGPIPE);
    close(in_pipe[1]);
  }

  if (output != nullptr) {
    close(out_pipe[1]);
    char buf[4096];
    while (true) {
      const ssize_t n = TEMP_FAILURE_RETRY(read(out_pipe[0], buf, sizeof(buf)));
      if (n <= 0) {
        if (n < 0) {
          PRINT_DEBUG("read from '%s': %m", args[0].c_str());
        }
        break;
      }
      output->append(buf, n);
    }
    close(out_pipe[0]);
  }

  return ReapChild(pid);
}


bool CommandExists(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }

  const char *env_path = getenv("PATH");
  std::string search_path = (env_path != nullptr && *env_path != '\0')
                                ? env_path
                                : DEFAULT_PATH;
  std::stringstream ss(search_path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    struct stat sb;
    if (stat(candidate.c_str(), &sb) == 0 && S_ISREG(sb.st_mode) &&
        access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}


ScopedFileLock::~ScopedFileLock() { Release(); }


int ScopedFileLock::TryLock(const std::string& path) {
  if (fd_ >= 0) {
    return 0;
  }

  const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return -1;
  }

  if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
    const int err = errno;
    close(fd);
    errno = err;
    return (err == EWOULDBLOCK) ? 1 : -1;
  }

  fd_ = fd;
  path_ = path;
  return 0;
}


void ScopedFileLock::Release() {
  if (fd_ < 0) {
    return;
  }
  if (close(fd_) < 0) {
    PRINT_DEBUG("close(%s): %m", path_.c_str());
  }
  fd_ = -1;
  path_.clear();
}


int CreateDirectories(const std::string& base_path) {
  std::error_code ec;
  fs::create_directories(base_path, ec);
  if (ec) {
    return ChrootMgrReport("create_directories(%s): %s", base_path.c_str(),
                           ec.message().c_str());
  }
  return 0;
}


std::string GetCurrentWorkingDirectory() {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) {
    return std::string();
  }
  return cwd.string();
}


bool isSubpath(const fs::path &base, const fs::path &sub) {
  auto baseIt = base.begin();
  auto subIt = sub.begin();

  while (baseIt != base.end() && subIt != sub.end() && *baseIt == *subIt) {
    ++baseIt;
    ++subIt;
  }
  return baseIt == base.end();
}


std::string CanonicPath(const std::string& path) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
  if (ec) {
    return fs::path(path).lexically_normal().string();
  }
  std::string res = canonical.string();
  // weakly_canonical keeps a trailing separator, mount tables never do.
  while (res.size() > 1 && res.back() == '/') {
    res.pop_back();
  }
  return res;
}


std::string GetInvokingUser() {
  const char *user = getenv("SUDO_USER");
  if (user == nullptr) {
    return std::string();
  }
  return std::string(user);
}


std::string GetSelfExecutable() {
  std::error_code ec;
  fs::path self = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::string();
  }
  return self.string();
}


static inline void trim(std::string& s) {
  auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

// Remove surrounding single or double quotes if present
static inline void unquote(std::string& s) {
  if (s.size() >= 2 &&
      ((s.front() == '"' && s.back() == '"') ||
       (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Parses /etc/os-release and returns PRETTY_NAME and VERSION_ID via out-params.
// Returns true iff at least one of the requested keys was found.
bool GetOSName(std::string& printable_name, std::string& version_id) {
  printable_name.clear();
  version_id.clear();

  std::ifstream file("/etc/os-release");
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) continue;

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    trim(key);
    trim(value);
    unquote(value);

    if (key == "PRETTY_NAME") {
      printable_name = value;
    } else if (key == "VERSION_ID") {
      version_id = value;
    }

    if (!printable_name.empty() && !version_id.empty()) {
      break;
    }
  }
  return (!printable_name.empty() || !version_id.empty());
}


bool GetKernelInfo(struct utsname* buf) {
  return (uname(buf) == 0);
}
