/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/mount-tools.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <mntent.h>
#include <stdio.h>
#include <string.h>
#include <sys/mount.h>

#include <string>
#include <vector>

static const char *const kBindMounts[] = {"dev", "proc", "sys", "tmp"};


bool LinuxMountSyscalls::IsMountPoint(const std::string& path) {
  const std::string canonical = CanonicPath(path);

  FILE *mounts = setmntent("/proc/self/mounts", "r");
  if (mounts == nullptr) {
    PRINT_DEBUG("setmntent(/proc/self/mounts): %m");
    return false;
  }

  bool found = false;
  struct mntent *ent;
  while ((ent = getmntent(mounts)) != nullptr) {
    if (canonical == ent->mnt_dir) {
      found = true;
      break;
    }
  }
  endmntent(mounts);
  return found;
}


int LinuxMountSyscalls::Mount(const MountPoint& mount_point) {
  if (mount_point.type == DEVPTS_MOUNT) {
    return mount("devpts", mount_point.target.c_str(), "devpts", 0, nullptr);
  }
  return mount(mount_point.source.c_str(), mount_point.target.c_str(), nullptr,
               MS_BIND, nullptr);
}


int LinuxMountSyscalls::Unmount(const std::string& target) {
  return umount2(target.c_str(), 0);
}


std::vector<MountPoint> GetJailMountPoints(const std::string& jail_root) {
  std::vector<MountPoint> mount_points;
  for (const char *dir : kBindMounts) {
    MountPoint mp;
    mp.relative_path = dir;
    mp.source = std::string("/") + dir;
    mp.target = jail_root + "/" + dir;
    mp.type = BIND_MOUNT;
    mount_points.push_back(mp);
  }

  // Must come after dev, it lives inside it.
  MountPoint devpts;
  devpts.relative_path = "dev/pts";
  devpts.source = "devpts";
  devpts.target = jail_root + "/dev/pts";
  devpts.type = DEVPTS_MOUNT;
  mount_points.push_back(devpts);
  return mount_points;
}


int MountAll(const std::string& jail_root, MountSyscalls* syscalls) {
  for (const MountPoint& mp : GetJailMountPoints(jail_root)) {
    if (syscalls->IsMountPoint(mp.target)) {
      PRINT_DEBUG("%s is already mounted.", mp.target.c_str());
      continue;
    }

    if (mp.type == DEVPTS_MOUNT) {
      PRINT_INFO("Mounting devpts to %s...", mp.target.c_str());
    } else {
      PRINT_INFO("Mounting %s to %s...", mp.source.c_str(), mp.target.c_str());
    }

    if (syscalls->Mount(mp) < 0) {
      std::string err = mp.source + " at " + mp.target + ": " + strerror(errno);
      return ChrootMgrReportErrorAndMessage(err, ErrorCode::MountFailed);
    }
  }
  return 0;
}


bool UnmountAll(const std::string& jail_root, MountSyscalls* syscalls,
                int* failures) {
  std::vector<MountPoint> mount_points = GetJailMountPoints(jail_root);
  bool any_mounted = false;
  int failed = 0;

  for (auto it = mount_points.rbegin(); it != mount_points.rend(); ++it) {
    if (!syscalls->IsMountPoint(it->target)) {
      PRINT_DEBUG("%s is not mounted.", it->target.c_str());
      continue;
    }

    any_mounted = true;
    PRINT_INFO("Unmounting %s...", it->target.c_str());
    if (syscalls->Unmount(it->target) < 0) {
      std::string err = it->target + ": " + strerror(errno);
      ChrootMgrReportErrorAndMessage(err, ErrorCode::UnmountFailed);
      failed++;
    }
  }

  if (failures != nullptr) {
    *failures = failed;
  }
  return any_mounted;
}


int ListJailMounts(const std::string& jail_root, std::vector<MountEntry>* entries,
                   const std::string& mount_table) {
  const fs::path root(CanonicPath(jail_root));

  FILE *mounts = setmntent(mount_table.c_str(), "r");
  if (mounts == nullptr) {
    return ChrootMgrReport("setmntent(%s): %m", mount_table.c_str());
  }

  struct mntent *ent;
  while ((ent = getmntent(mounts)) != nullptr) {
    if (isSubpath(root, fs::path(ent->mnt_dir))) {
      MountEntry entry;
      entry.fsname = ent->mnt_fsname;
      entry.dir = ent->mnt_dir;
      entry.type = ent->mnt_type;
      entry.opts = ent->mnt_opts;
      entries->push_back(entry);
    }
  }
  endmntent(mounts);
  return 0;
}


MountSession::MountSession(const std::string& jail_root,
                           MountSyscalls* syscalls)
    : jail_root_(jail_root), syscalls_(syscalls), active_(false) {}


MountSession::~MountSession() { Release(); }


int MountSession::Mount() {
  // Set first: a failure halfway still leaves mounts to clean up.
  active_ = true;
  return MountAll(jail_root_, syscalls_);
}


int MountSession::Release() {
  if (!active_) {
    return 0;
  }
  active_ = false;

  int failures = 0;
  PRINT_INFO("Cleaning up: Unmounting filesystems...");
  UnmountAll(jail_root_, syscalls_, &failures);
  PRINT_INFO("Cleanup complete.");
  return failures;
}
