/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/trace-reconciler.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/trace-parser.h"

#include <errno.h>
#include <pwd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>
#include <vector>


std::vector<std::string> GetTracerCommand(const std::string& log_dir,
                                          const std::string& jail_root) {
  return {"strace", "-ff", "-tt", "-o", log_dir + "/" + TRACE_LOG_PREFIX,
          "chroot", jail_root};
}


// Returns the pid encoded in a raw trace file name, or -1 if `name` isn't
// one.
static pid_t TraceFilePid(const std::string& name) {
  static const std::string prefix = std::string(TRACE_LOG_PREFIX) + ".";
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
    return -1;
  }

  const std::string suffix = name.substr(prefix.size());
  if (suffix.size() > 9 ||
      !std::all_of(suffix.begin(), suffix.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return -1;
  }
  return static_cast<pid_t>(atol(suffix.c_str()));
}


int PrepareTraceLogDirectory(const std::string& log_dir, ScopedFileLock* lock) {
  if (CreateDirectories(log_dir) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  const std::string lock_path = log_dir + "/" + TRACE_LOCK_NAME;
  const int res = lock->TryLock(lock_path);
  if (res < 0) {
    return ChrootMgrReport("flock(%s): %m", lock_path.c_str());
  }
  if (res > 0) {
    return ChrootMgrReportErrorAndMessage(log_dir,
                                          ErrorCode::TraceLogDirectoryBusy);
  }

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (TraceFilePid(name) >= 0) {
      lock->Release();
      return ChrootMgrReportErrorAndMessage(
          log_dir + " still holds " + name + " from an earlier session",
          ErrorCode::TraceLogDirectoryBusy);
    }
  }
  if (ec) {
    lock->Release();
    return ChrootMgrReport("reading %s: %s", log_dir.c_str(),
                           ec.message().c_str());
  }
  return 0;
}


int RunTracedSession(const Options& opt, int* exit_status) {
  ScopedFileLock lock;
  if (PrepareTraceLogDirectory(opt.trace_log_dir, &lock) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  PRINT_INFO("Tracing the chroot session, logs go to %s",
             opt.trace_log_dir.c_str());
  const int res =
      RunForegroundCommand(GetTracerCommand(opt.trace_log_dir, opt.jail_root),
                           ErrorCode::TracerLaunchFailed, exit_status);
  if (res < 0) {
    return res;
  }

  ReconcileReport report;
  ReconcileTraceLogs(opt.trace_log_dir, opt.ignore_set, &report);
  PRINT_INFO("Trace logs: %zu kept, %zu discarded, %d failed.",
             report.kept.size(), report.discarded.size(), report.failures);

  NormalizeOwnership(opt.trace_log_dir, GetInvokingUser());
  return 0;
}


// Final path segment of `path`, ignoring trailing slashes.
static std::string ProgramName(const std::string& path) {
  size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) {
    return std::string();
  }
  size_t start = path.rfind('/', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return path.substr(start, end - start + 1);
}


int ReconcileTraceLogs(const std::string& log_dir,
                       const std::set<std::string>& ignore_set,
                       ReconcileReport* report) {
  std::vector<std::pair<pid_t, std::string>> files;

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
    const pid_t pid = TraceFilePid(entry.path().filename().string());
    if (pid < 0) {
      continue;
    }
    files.emplace_back(pid, entry.path().string());
  }
  if (ec) {
    report->failures++;
    return ChrootMgrReportErrorAndMessage(log_dir + ": " + ec.message(),
                                          ErrorCode::ReconcileFailed);
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    TraceLogFile log;
    log.path = file.second;
    log.pid = file.first;
    const std::string& raw_path = log.path;

    std::ifstream in(raw_path);
    if (!in.is_open()) {
      ChrootMgrReportErrorAndMessage(raw_path + ": " + strerror(errno),
                                     ErrorCode::ReconcileFailed);
      report->failures++;
      continue;
    }

    if (FindFirstExecvePath(in, &log.program_path)) {
      log.program = ProgramName(log.program_path);
    }
    if (log.program.empty()) {
      log.program = "pid" + std::to_string(log.pid);
    }
    in.close();

    if (ignore_set.count(log.program) > 0) {
      PRINT_DEBUG("Deleting trace log of %s (%d)", log.program.c_str(), log.pid);
      if (unlink(raw_path.c_str()) < 0) {
        ChrootMgrReportErrorAndMessage(raw_path + ": " + strerror(errno),
                                       ErrorCode::ReconcileFailed);
        report->failures++;
        continue;
      }
      report->discarded.push_back(log);
      continue;
    }

    const std::string dest =
        log_dir + "/" + log.program + "_" + std::to_string(log.pid) + ".log";
    PRINT_DEBUG("Renaming %s to %s", raw_path.c_str(), dest.c_str());
    // link() fails with EEXIST instead of replacing `dest`.
    if (link(raw_path.c_str(), dest.c_str()) < 0) {
      ChrootMgrReportErrorAndMessage(
          errno == EEXIST ? dest + " already exists"
                          : dest + ": " + strerror(errno),
          ErrorCode::ReconcileFailed);
      report->failures++;
      continue;
    }
    if (unlink(raw_path.c_str()) < 0) {
      ChrootMgrReportErrorAndMessage(raw_path + ": " + strerror(errno),
                                     ErrorCode::ReconcileFailed);
      if (unlink(dest.c_str()) < 0) {
        PRINT_DEBUG("unlink(%s): %m", dest.c_str());
      }
      report->failures++;
      continue;
    }
    log.final_path = dest;
    report->kept.push_back(log);
  }
  return 0;
}


static int NormalizeEntry(const fs::path& path, bool is_dir, bool change_owner,
                          uid_t uid, gid_t gid) {
  int res = 0;
  if (change_owner && lchown(path.c_str(), uid, gid) < 0) {
    res = ChrootMgrReportErrorAndMessage(
        "chown " + path.string() + ": " + strerror(errno),
        ErrorCode::OwnershipFailed);
  }

  std::error_code ec;
  fs::permissions(path,
                  is_dir ? static_cast<fs::perms>(0755)
                         : static_cast<fs::perms>(0644),
                  fs::perm_options::replace, ec);
  if (ec) {
    res = ChrootMgrReportErrorAndMessage(
        "chmod " + path.string() + ": " + ec.message(),
        ErrorCode::OwnershipFailed);
  }
  return res;
}


// Normalizes everything below `dir`. A directory that can't be read is
// reported and skipped, the rest of the tree is still handled.
static int NormalizeTree(const fs::path& dir, bool change_owner, uid_t uid,
                         gid_t gid) {
  int res = 0;
  std::error_code ec;
  fs::directory_iterator it(dir, ec), end;
  while (!ec && it != end) {
    const fs::path path = it->path();
    const fs::file_status st = it->symlink_status(ec);
    if (ec) {
      res = ChrootMgrReportErrorAndMessage(path.string() + ": " + ec.message(),
                                           ErrorCode::OwnershipFailed);
      ec.clear();
    } else if (fs::is_directory(st) || fs::is_regular_file(st)) {
      if (NormalizeEntry(path, fs::is_directory(st), change_owner, uid,
                         gid) < 0) {
        res = RECOVERABLE_FAIL;
      }
      if (fs::is_directory(st) &&
          NormalizeTree(path, change_owner, uid, gid) < 0) {
        res = RECOVERABLE_FAIL;
      }
    }
    it.increment(ec);
  }
  if (ec) {
    res = ChrootMgrReportErrorAndMessage(dir.string() + ": " + ec.message(),
                                         ErrorCode::OwnershipFailed);
  }
  return res;
}


int NormalizeOwnership(const std::string& log_dir, const std::string& user) {
  bool change_owner = false;
  uid_t uid = 0;
  gid_t gid = 0;
  int res = 0;

  if (!user.empty()) {
    struct passwd *pwd = getpwnam(user.c_str());
    if (pwd == nullptr) {
      res = ChrootMgrReportErrorAndMessage("unknown user " + user,
                                           ErrorCode::OwnershipFailed);
    } else {
      change_owner = true;
      uid = pwd->pw_uid;
      gid = pwd->pw_gid;
      PRINT_DEBUG("Handing %s over to %s (%u:%u)", log_dir.c_str(),
                  user.c_str(), uid, gid);
    }
  }

  std::error_code ec;
  if (!fs::is_directory(fs::symlink_status(log_dir, ec))) {
    return ChrootMgrReportErrorAndMessage(log_dir + " is not a directory",
                                          ErrorCode::OwnershipFailed);
  }
  if (NormalizeEntry(log_dir, true, change_owner, uid, gid) < 0) {
    res = RECOVERABLE_FAIL;
  }
  if (NormalizeTree(log_dir, change_owner, uid, gid) < 0) {
    res = RECOVERABLE_FAIL;
  }
  return res;
}
