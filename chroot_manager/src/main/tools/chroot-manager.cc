/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

/**
 * chroot-manager maintains a Debian chroot jail and lets the user work in it:
 *
 *  - create bootstraps the jail with debootstrap.
 *  - connect bind mounts dev, proc, sys and tmp and mounts devpts inside the
 *    jail, opens the X server and runs an interactive chroot. The mounts are
 *    removed again when the session ends, whichever way it ends.
 *  - With --daemon the session runs under strace; afterwards every per-process
 *    trace file is named after the program it ran, or removed if that program
 *    is uninteresting.
 *  - disconnect and status clean up and inspect leftover mounts.
 *  - install and uninstall manage the tool's own installation.
 */

#include "src/main/tools/chroot-manager.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/mount-tools.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/trace-reconciler.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <system_error>
#include <vector>

#ifndef VERSION
#define VERSION "unknown"
#endif

__attribute__((used, section(".version")))
const char build_version[] = VERSION;


int RequireRoot(const Options& opt) {
  if (geteuid() == 0) {
    return 0;
  }

  const std::string msg = std::string("The '") + CommandName(opt.command) +
                          "' command must be run as root (use sudo).";
  if (getenv(ENV_PRESERVED_MARKER) != nullptr) {
    return ChrootMgrReportErrorAndMessage(msg, ErrorCode::NotRoot);
  }

  std::string self = GetSelfExecutable();
  if (self.empty() && !opt.original_args.empty()) {
    self = opt.original_args[0];
  }

  std::vector<std::string> args = {"sudo", "-E", self};
  for (size_t i = 1; i < opt.original_args.size(); ++i) {
    args.push_back(opt.original_args[i]);
  }
  std::vector<char *> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(nullptr);

  PRINT_INFO("Forcing re-exec with preserved environment variables...");
  setenv(ENV_PRESERVED_MARKER, "1", 1);
  fflush(stdout);
  execvp(argv[0], argv.data());

  ChrootMgrReport("execvp(sudo): %m");
  return ChrootMgrReportErrorAndMessage(msg, ErrorCode::NotRoot);
}


int CheckDependencies(const std::vector<std::string>& commands) {
  int res = 0;
  for (const std::string& cmd : commands) {
    if (!CommandExists(cmd)) {
      res = ChrootMgrReportErrorAndMessage(cmd, ErrorCode::MissingDependency);
    }
  }
  return res;
}


int CheckJailExists(const std::string& jail_root) {
  struct stat sb;
  if (stat(jail_root.c_str(), &sb) < 0 || !S_ISDIR(sb.st_mode)) {
    int res = ChrootMgrReportErrorAndMessage(jail_root,
                                             ErrorCode::JailDoesNotExist);
    printf("Please create the chroot environment first using the 'create' "
           "command.\n");
    return res;
  }
  return 0;
}


int CreateJail(const Options& opt) {
  if (CheckDependencies({"debootstrap"}) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  std::error_code ec;
  if (fs::exists(fs::symlink_status(opt.jail_root, ec))) {
    int res = ChrootMgrReportErrorAndMessage(opt.jail_root,
                                             ErrorCode::JailAlreadyExists);
    printf("Use 'connect' to enter it, or 'disconnect' if mounts remain.\n");
    return res;
  }

  PRINT_INFO("Creating chroot jail at %s using debootstrap...",
             opt.jail_root.c_str());
  if (CreateDirectories(opt.jail_root) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  const int status = RunCommand(
      {"debootstrap", opt.suite, opt.jail_root, opt.mirror}, nullptr, nullptr);
  if (status != 0) {
    return ChrootMgrReportErrorAndMessage(
        "debootstrap failed. Check your network and settings.",
        ErrorCode::CommandFailed);
  }

  PRINT_INFO("Chroot jail successfully created.");
  return 0;
}


// Blocks until the user presses Enter. A termination signal cancels the wait.
static int WaitForEnter() {
  printf("Press Enter to continue...\n");
  fflush(stdout);

  while (true) {
    char c;
    const ssize_t n = read(STDIN_FILENO, &c, 1);
    if (n < 0 && errno == EINTR && !TerminationRequested()) {
      continue;
    }
    if (TerminationRequested()) {
      return ChrootMgrReportErrorAndMessage(strsignal(TerminationSignal()),
                                            ErrorCode::SessionCancelled);
    }
    if (n < 0) {
      return ChrootMgrReport("read(stdin): %m");
    }
    if (n == 0 || c == '\n') {
      return 0;
    }
  }
}


static void PrintXauthBanner(const std::string& xauth_keys) {
  const std::string first_key = xauth_keys.substr(0, xauth_keys.find('\n'));

  printf("\n");
  printf("------------------------------\n");
  printf("Now entering the chroot environment.\n");
  printf("Inside the chroot, add the X authentication key by running:\n");
  printf("   xauth add <paste-from-clipboard>\n");
  printf("For example, if your clipboard contains:\n");
  printf("   %s\n", first_key.c_str());
  printf("then run:\n");
  printf("   xauth add %s\n", first_key.c_str());
  printf("------------------------------\n");
}


static int PrepareXAccess() {
  PRINT_INFO("Running 'xhost +' to allow X connections...");
  if (RunCommand({"xhost", "+"}, nullptr, nullptr) != 0) {
    return ChrootMgrReportErrorAndMessage("xhost +", ErrorCode::CommandFailed);
  }

  PRINT_INFO("Retrieving X authentication keys with 'xauth list'...");
  std::string xauth_keys;
  if (RunCommand({"xauth", "list"}, nullptr, &xauth_keys) != 0) {
    PRINT_DEBUG("xauth list exited with an error");
  }
  while (!xauth_keys.empty() && xauth_keys.back() == '\n') {
    xauth_keys.pop_back();
  }

  if (xauth_keys.empty()) {
    PRINT_ERROR("Warning: 'xauth list' returned no output.");
  } else if (CommandExists("xclip") &&
             RunCommand({"xclip", "-selection", "clipboard"}, &xauth_keys,
                        nullptr) == 0) {
    PRINT_INFO("X authentication keys have been copied to your clipboard.");
  } else {
    PRINT_INFO("xclip not found. Here are your X authentication keys:");
    printf("%s\n", xauth_keys.c_str());
  }

  PrintXauthBanner(xauth_keys);
  return 0;
}


int ConnectJail(const Options& opt, MountSyscalls* syscalls, int* exit_status) {
  std::vector<std::string> deps = {"chroot", "xhost", "xauth"};
  if (opt.daemon) {
    deps.push_back("strace");
  }
  if (CheckDependencies(deps) < 0 || CheckJailExists(opt.jail_root) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  // Unmounts on every way out of this function.
  MountSession session(opt.jail_root, syscalls);
  if (session.Mount() < 0) {
    return UNRECOVERABLE_FAIL;
  }

  if (PrepareXAccess() < 0 || WaitForEnter() < 0) {
    return UNRECOVERABLE_FAIL;
  }

  PRINT_INFO("Entering chroot at %s...", opt.jail_root.c_str());
  int res;
  if (opt.daemon) {
    PRINT_INFO("Daemon mode enabled. Monitoring chroot session with strace.");
    res = RunTracedSession(opt, exit_status);
  } else {
    res = RunForegroundCommand({"chroot", opt.jail_root},
                               ErrorCode::CommandFailed, exit_status);
  }
  if (res < 0) {
    return res;
  }

  if (TerminationRequested()) {
    PRINT_DEBUG("session ended by signal %d", TerminationSignal());
  }
  PRINT_INFO("Chroot session ended.");
  return 0;
}


int DisconnectJail(const Options& opt, MountSyscalls* syscalls) {
  if (CheckJailExists(opt.jail_root) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  std::vector<MountEntry> mounts;
  if (ListJailMounts(opt.jail_root, &mounts) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (mounts.empty()) {
    PRINT_INFO("Chroot environment appears to be clean; no mounts found at %s.",
               opt.jail_root.c_str());
    return 0;
  }

  PRINT_INFO("Running disconnect: unmounting chroot filesystems...");
  int failures = 0;
  UnmountAll(opt.jail_root, syscalls, &failures);

  if (RunCommand({"xhost", "-"}, nullptr, nullptr) == 0) {
    PRINT_INFO("X server access has been revoked.");
  } else {
    PRINT_ERROR("Warning: failed to revoke X server permissions with 'xhost -'.");
  }
  return failures > 0 ? RECOVERABLE_FAIL : 0;
}


int ShowStatus(const Options& opt) {
  std::vector<MountEntry> mounts;
  if (ListJailMounts(opt.jail_root, &mounts) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  printf("Mount status for chroot jail (%s):\n", opt.jail_root.c_str());
  if (mounts.empty()) {
    printf("No mounts found for %s.\n", opt.jail_root.c_str());
    return 0;
  }
  for (const MountEntry& m : mounts) {
    printf("%s on %s type %s (%s)\n", m.fsname.c_str(), m.dir.c_str(),
           m.type.c_str(), m.opts.c_str());
  }
  return 0;
}


static int CopyFile(const std::string& from, const std::string& to) {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return ChrootMgrReportErrorAndMessage(
        from + " -> " + to + ": " + ec.message(), ErrorCode::InstallFailed);
  }
  return 0;
}


int InstallProgram(const Options& opt) {
  const std::string self = GetSelfExecutable();
  if (self.empty()) {
    return ChrootMgrReportErrorAndMessage("can't resolve /proc/self/exe",
                                          ErrorCode::InstallFailed);
  }

  PRINT_INFO("Installing chroot_manager from %s to %s...", self.c_str(),
             INSTALL_BIN_PATH);
  if (CopyFile(self, INSTALL_BIN_PATH) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  if (chmod(INSTALL_BIN_PATH, 0755) < 0) {
    return ChrootMgrReportErrorAndMessage(
        std::string("chmod ") + INSTALL_BIN_PATH + ": " + strerror(errno),
        ErrorCode::InstallFailed);
  }

  struct stat sb;
  if (stat(MAN_PAGE_NAME, &sb) == 0) {
    PRINT_INFO("Installing man page...");
    const std::string man_page = std::string(INSTALL_MAN_DIR) + "/" + MAN_PAGE_NAME;
    if (CreateDirectories(INSTALL_MAN_DIR) == 0 &&
        CopyFile(MAN_PAGE_NAME, man_page) == 0 &&
        RunCommand({"gzip", "-f", man_page}, nullptr, nullptr) != 0) {
      PRINT_ERROR("Failed to compress %s.", man_page.c_str());
    }
  } else {
    PRINT_DEBUG("No man page (%s) found in the current directory.",
                MAN_PAGE_NAME);
  }

  if (stat(BASH_COMPLETION_NAME, &sb) == 0) {
    PRINT_INFO("Installing bash completion...");
    if (CopyFile(BASH_COMPLETION_NAME, INSTALL_BASH_COMPLETION_PATH) < 0) {
      PRINT_ERROR("Failed to install bash completion.");
    }
  } else {
    PRINT_DEBUG("No bash completion file found in the current directory.");
  }

  PRINT_INFO("Installation complete.");
  return 0;
}


static void RemoveIfPresent(const std::string& path) {
  if (unlink(path.c_str()) < 0 && errno != ENOENT) {
    PRINT_ERROR("Failed to remove %s: %s", path.c_str(), strerror(errno));
  }
}


int UninstallProgram(const Options& opt) {
  PRINT_INFO("Uninstalling chroot_manager from %s...", INSTALL_BIN_PATH);
  RemoveIfPresent(INSTALL_BIN_PATH);

  PRINT_INFO("Removing man page...");
  RemoveIfPresent(std::string(INSTALL_MAN_DIR) + "/" + MAN_PAGE_NAME + ".gz");

  PRINT_INFO("Removing bash completion...");
  RemoveIfPresent(INSTALL_BASH_COMPLETION_PATH);

  PRINT_INFO("Uninstallation complete.");
  return 0;
}


int ChrootMgrMain(const Options& opt) {
  const char *program_name =
      opt.original_args.empty() ? "chroot-manager" : opt.original_args[0].c_str();

  if (opt.command == CMD_HELP) {
    PrintHelp(program_name);
    return EXIT_SUCCESS;
  }

  if (CommandNeedsRoot(opt.command) && RequireRoot(opt) < 0) {
    return EXIT_FAILURE;
  }

  // Open the persistent log early so we don't lose any output.
  global_verbose = opt.verbose;
  OpenLog(opt.log_file);
  logSystem();
  PRINT_DEBUG("running '%s' on %s", CommandName(opt.command),
              opt.jail_root.c_str());

  LinuxMountSyscalls syscalls;
  int exit_status = 0;
  int res;
  switch (opt.command) {
    case CMD_CREATE:
      res = CreateJail(opt);
      break;
    case CMD_CONNECT:
      InstallTerminationHandlers();
      res = ConnectJail(opt, &syscalls, &exit_status);
      break;
    case CMD_DISCONNECT:
      res = DisconnectJail(opt, &syscalls);
      break;
    case CMD_STATUS:
      res = ShowStatus(opt);
      break;
    case CMD_INSTALL:
      res = InstallProgram(opt);
      break;
    case CMD_UNINSTALL:
      res = UninstallProgram(opt);
      break;
    default:
      res = ChrootMgrReportError(ErrorCode::InvalidCommand);
      break;
  }

  CloseLog();
  if (res < 0) {
    return EXIT_FAILURE;
  }
  return exit_status;
}
