/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TRACE_RECONCILER_H_
#define SRC_MAIN_TOOLS_TRACE_RECONCILER_H_

#include <sys/types.h>

#include <set>
#include <string>
#include <vector>

#include "src/main/tools/chroot-manager-options.h"

class ScopedFileLock;

// strace -ff appends ".<pid>" to this.
#define TRACE_LOG_PREFIX "chroot_daemon.log"
#define TRACE_LOCK_NAME ".chroot_daemon.lock"

struct TraceLogFile {
  // The raw strace file
  std::string path;
  pid_t pid;
  // First program the process executed; empty if the trace has none
  std::string program_path;
  // Basename of program_path, or "pid<pid>"
  std::string program;
  // Where the file ended up; empty if it was deleted
  std::string final_path;
};

struct ReconcileReport {
  std::vector<TraceLogFile> kept;
  std::vector<TraceLogFile> discarded;
  int failures = 0;
};

// The tracer command line for a session in `jail_root` logging to `log_dir`.
std::vector<std::string> GetTracerCommand(const std::string& log_dir,
                                          const std::string& jail_root);

// Creates `log_dir` and locks it for a tracing session. Fails with
// TraceLogDirectoryBusy if another session holds the lock or raw trace files
// of an earlier session are still there.
int PrepareTraceLogDirectory(const std::string& log_dir, ScopedFileLock* lock);

// Runs the jail session under strace, then reconciles the trace logs and
// hands the log directory over to the invoking user. The directory stays
// locked throughout. The session's exit code goes to `exit_status`.
int RunTracedSession(const Options& opt, int* exit_status);

// Renames every raw trace file in `log_dir` after the program its process
// executed, or deletes it if that program is in `ignore_set`. Problems with
// single files are counted in `report` and don't stop the pass.
int ReconcileTraceLogs(const std::string& log_dir,
                       const std::set<std::string>& ignore_set,
                       ReconcileReport* report);

// Gives `log_dir` and everything below it to `user` (skipped if empty) with
// modes 0755 for directories and 0644 for files. Best effort.
int NormalizeOwnership(const std::string& log_dir, const std::string& user);

#endif  // SRC_MAIN_TOOLS_TRACE_RECONCILER_H_
