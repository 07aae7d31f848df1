/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifdef LIBCHROOTMANAGER

#include "src/main/tools/chroot-manager-api.h"
#include "src/main/tools/chroot-manager-options.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/mount-tools.h"
#include "src/main/tools/trace-reconciler.h"

int chroot_manager_get_last_error_code() {
  return ChrootMgrGetErrorCode();
}


const char* chroot_manager_get_last_error_msg() {
  return ChrootMgrGetErrorMsg();
}


int chroot_manager_enable_log(const std::string& path) {
  if (!OpenLog(path)) {
    return ChrootMgrReport("can't open log file %s", path.c_str());
  }
  return 0;
}


void chroot_manager_set_verbose(bool verbose) {
  global_verbose = verbose;
}


int chroot_manager_mount_all(const std::string& jail_root) {
  LinuxMountSyscalls syscalls;
  return MountAll(jail_root, &syscalls);
}


int chroot_manager_unmount_all(const std::string& jail_root) {
  LinuxMountSyscalls syscalls;
  int failures = 0;
  UnmountAll(jail_root, &syscalls, &failures);
  return failures > 0 ? RECOVERABLE_FAIL : 0;
}


bool chroot_manager_is_mounted(const std::string& path) {
  LinuxMountSyscalls syscalls;
  return syscalls.IsMountPoint(path);
}


int chroot_manager_reconcile_logs(const std::string& log_dir,
                                  const std::vector<std::string>& ignore) {
  std::set<std::string> ignore_set = DefaultIgnoreSet();
  ignore_set.insert(ignore.begin(), ignore.end());

  ReconcileReport report;
  const int res = ReconcileTraceLogs(log_dir, ignore_set, &report);
  if (res < 0) {
    return res;
  }
  return report.failures;
}


int chroot_manager_normalize_ownership(const std::string& log_dir,
                                       const std::string& user) {
  return NormalizeOwnership(log_dir, user);
}

#endif
