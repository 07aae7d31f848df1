/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

// This header contains the APIs for C++ only and thus we can
// use std::string


#ifndef SRC_MAIN_TOOLS_CHROOT_MANAGER_API_H_
#define SRC_MAIN_TOOLS_CHROOT_MANAGER_API_H_

#ifdef LIBCHROOTMANAGER

#include <string>
#include <vector>

// Appends all log output to the file at `path`
int chroot_manager_enable_log(const std::string& path);
void chroot_manager_set_verbose(bool verbose);

// Mounts dev, proc, sys, tmp and dev/pts into the jail at `jail_root`, and
// removes them again, children first. Both need root.
int chroot_manager_mount_all(const std::string& jail_root);
int chroot_manager_unmount_all(const std::string& jail_root);
bool chroot_manager_is_mounted(const std::string& path);

// Renames or removes the raw strace files in `log_dir`. Programs named in
// `ignore` are added to the default ignore list. Returns the number of files
// that couldn't be handled, or a negative error.
int chroot_manager_reconcile_logs(const std::string& log_dir,
                                  const std::vector<std::string>& ignore);
int chroot_manager_normalize_ownership(const std::string& log_dir,
                                       const std::string& user);

// Returns error code and error messages
int chroot_manager_get_last_error_code();
const char* chroot_manager_get_last_error_msg();

#endif

#endif
