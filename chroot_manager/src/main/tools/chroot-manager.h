/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_CHROOT_MANAGER_H_
#define SRC_MAIN_TOOLS_CHROOT_MANAGER_H_

#include <string>
#include <vector>

#include "src/main/tools/chroot-manager-options.h"

class MountSyscalls;

extern const char build_version[];

// Runs the command selected in `opt` and returns the process exit code.
int ChrootMgrMain(const Options& opt);

// Returns 0 when we run as root. Otherwise re-executes the tool through
// `sudo -E` (only returning if that fails) unless this already happened once.
int RequireRoot(const Options& opt);

// Reports every command of `commands` that can't be found in $PATH.
int CheckDependencies(const std::vector<std::string>& commands);

int CheckJailExists(const std::string& jail_root);

int CreateJail(const Options& opt);
// `exit_status` receives the exit code of the jail session.
int ConnectJail(const Options& opt, MountSyscalls* syscalls, int* exit_status);
int DisconnectJail(const Options& opt, MountSyscalls* syscalls);
int ShowStatus(const Options& opt);
int InstallProgram(const Options& opt);
int UninstallProgram(const Options& opt);

#endif  // SRC_MAIN_TOOLS_CHROOT_MANAGER_H_
