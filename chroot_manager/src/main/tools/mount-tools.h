/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_MOUNT_TOOLS_H_
#define SRC_MAIN_TOOLS_MOUNT_TOOLS_H_

#include <string>
#include <vector>

enum MountType { BIND_MOUNT, DEVPTS_MOUNT };

struct MountPoint {
  // Relative to the jail root: dev, proc, sys, tmp or dev/pts
  std::string relative_path;
  std::string source;
  std::string target;
  MountType type;
};

// One line of the host mount table.
struct MountEntry {
  std::string fsname;
  std::string dir;
  std::string type;
  std::string opts;
};

// The kernel side of mounting, so that the lifecycle logic can be exercised
// without privileges.
class MountSyscalls {
 public:
  virtual ~MountSyscalls() {}

  virtual bool IsMountPoint(const std::string& path) = 0;
  // Both return 0 on success, -1 with errno set otherwise.
  virtual int Mount(const MountPoint& mount_point) = 0;
  virtual int Unmount(const std::string& target) = 0;
};

// Uses /proc/self/mounts, mount(2) and umount2(2).
class LinuxMountSyscalls : public MountSyscalls {
 public:
  bool IsMountPoint(const std::string& path) override;
  int Mount(const MountPoint& mount_point) override;
  int Unmount(const std::string& target) override;
};

// The jail's mount points in mount order: dev, proc, sys, tmp, dev/pts.
std::vector<MountPoint> GetJailMountPoints(const std::string& jail_root);

// Mounts every jail mount point that isn't mounted yet. Stops at the first
// failure and returns a negative value; mounts done so far are left in place.
int MountAll(const std::string& jail_root, MountSyscalls* syscalls);

// Unmounts every mounted jail mount point, children before parents. Failures
// are reported but don't stop the pass; their number goes to `failures`.
// Returns whether anything was mounted.
bool UnmountAll(const std::string& jail_root, MountSyscalls* syscalls,
                int* failures = nullptr);

// Reads `mount_table` (the host's by default) and returns the entries at or
// below `jail_root`.
int ListJailMounts(const std::string& jail_root, std::vector<MountEntry>* entries,
                   const std::string& mount_table = "/proc/self/mounts");

// Owns the jail mounts of a connect session: whatever MountAll managed to
// mount is unmounted again when the session goes out of scope, however that
// happens.
class MountSession {
 public:
  MountSession(const std::string& jail_root, MountSyscalls* syscalls);
  ~MountSession();

  MountSession(const MountSession&) = delete;
  MountSession& operator=(const MountSession&) = delete;

  int Mount();
  // Unmounts now instead of at destruction. Returns the number of failures.
  int Release();

 private:
  std::string jail_root_;
  MountSyscalls* syscalls_;
  bool active_;
};

#endif  // SRC_MAIN_TOOLS_MOUNT_TOOLS_H_
