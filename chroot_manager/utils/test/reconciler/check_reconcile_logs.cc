/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <assert.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "src/main/tools/chroot-manager-options.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/trace-reconciler.h"

static std::string make_temp_dir() {
    char tmpl[] = "/tmp/chroot_mgr_logs_XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    return std::string(dir);
}

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    assert(f.is_open());
    f << content;
}

static bool exists(const std::string& path) {
    struct stat sb;
    return lstat(path.c_str(), &sb) == 0;
}

static std::string trace_of(const std::string& program) {
    return "10:41:07.000001 execve(\"" + program + "\", [\"x\"], 0x7ffe /* 21 vars */) = 0\n"
           "10:41:07.000002 brk(NULL) = 0x5581\n"
           "10:41:07.000003 execve(\"/bin/sh\", [\"sh\"], 0x7ffe) = 0\n"
           "10:41:07.000004 exit_group(0) = ?\n"
           "10:41:07.000005 +++ exited with 0 +++\n";
}

static void check_reconcile() {
    const std::string dir = make_temp_dir();
    const std::string raw = dir + "/" TRACE_LOG_PREFIX ".";

    write_file(raw + "100", trace_of("/bin/ls"));
    write_file(raw + "101", trace_of("/usr/bin/vim"));
    write_file(raw + "102", "10:41:07.000001 <... execve resumed>) = 0\n"
                            "10:41:07.000002 exit_group(0) = ?\n");
    write_file(raw + "103", trace_of("/usr/bin/python3"));
    write_file(raw + "104", trace_of("/usr/bin/python3"));
    write_file(raw + "105", trace_of("/usr/bin/make"));
    write_file(dir + "/make_105.log", "left over\n");
    write_file(raw + "106", trace_of("/usr/bin/gdb"));
    assert(symlink("/nonexistent/target", (dir + "/gdb_106.log").c_str()) == 0);
    write_file(raw + "abc", trace_of("/usr/bin/vim"));
    write_file(dir + "/notes.txt", "keep me\n");

    ChrootMgrClearError();
    ReconcileReport report;
    assert(ReconcileTraceLogs(dir, DefaultIgnoreSet(), &report) == 0);

    // ls is a trivial command.
    assert(!exists(raw + "100"));
    assert(report.discarded.size() == 1);
    assert(report.discarded[0].pid == 100 && report.discarded[0].program == "ls");
    assert(report.discarded[0].final_path.empty());

    assert(report.kept.size() == 4);
    assert(report.kept[0].pid == 101 && report.kept[0].program == "vim");
    assert(report.kept[0].program_path == "/usr/bin/vim");
    assert(report.kept[0].path == raw + "101");
    assert(report.kept[0].final_path == dir + "/vim_101.log");
    assert(exists(dir + "/vim_101.log") && !exists(raw + "101"));

    // No execve: named after the pid.
    assert(report.kept[1].program == "pid102");
    assert(report.kept[1].program_path.empty());
    assert(exists(dir + "/pid102_102.log"));

    // Same program, distinct pids.
    assert(exists(dir + "/python3_103.log"));
    assert(exists(dir + "/python3_104.log"));
    assert(report.kept[2].pid == 103 && report.kept[3].pid == 104);

    // Never overwrite, keep the raw file instead.
    assert(report.failures == 2);
    assert(exists(raw + "105"));
    assert(exists(raw + "106"));
    assert(fs::is_symlink(fs::symlink_status(dir + "/gdb_106.log")));
    assert(ChrootMgrGetErrorCode() == static_cast<int>(ErrorCode::ReconcileFailed));
    std::ifstream old(dir + "/make_105.log");
    std::string line;
    std::getline(old, line);
    assert(line == "left over");

    // Not ours.
    assert(exists(raw + "abc"));
    assert(exists(dir + "/notes.txt"));

    // A second pass only retries what failed.
    ReconcileReport again;
    assert(ReconcileTraceLogs(dir, DefaultIgnoreSet(), &again) == 0);
    assert(again.kept.empty() && again.discarded.empty());
    assert(again.failures == 2);

    fs::remove_all(dir);
}

static void check_custom_ignore_set() {
    const std::string dir = make_temp_dir();
    const std::string raw = dir + "/" TRACE_LOG_PREFIX ".";
    write_file(raw + "7", trace_of("/usr/bin/vim"));
    write_file(raw + "8", trace_of("/bin/ls"));

    std::set<std::string> ignore = {"vim"};
    ReconcileReport report;
    assert(ReconcileTraceLogs(dir, ignore, &report) == 0);
    assert(!exists(raw + "7"));
    assert(exists(dir + "/ls_8.log"));
    assert(report.kept.size() == 1 && report.discarded.size() == 1);

    fs::remove_all(dir);
}

static void check_missing_directory() {
    ReconcileReport report;
    assert(ReconcileTraceLogs("/nonexistent/chroot_daemon_logs", DefaultIgnoreSet(), &report) < 0);
    assert(report.failures == 1);
}

static void check_tracer_command() {
    std::vector<std::string> expected = {"strace", "-ff", "-tt", "-o",
                                         "/home/u/logs/chroot_daemon.log",
                                         "chroot", "/var/chroot"};
    assert(GetTracerCommand("/home/u/logs", "/var/chroot") == expected);
}

static void check_log_dir_busy() {
    const std::string base = make_temp_dir();
    const std::string dir = base + "/nested/chroot_daemon_logs";

    ScopedFileLock lock;
    assert(PrepareTraceLogDirectory(dir, &lock) == 0);
    assert(lock.locked());
    assert(exists(dir + "/" TRACE_LOCK_NAME));

    // A second session on the same directory.
    ChrootMgrClearError();
    ScopedFileLock other;
    assert(PrepareTraceLogDirectory(dir, &other) < 0);
    assert(!other.locked());
    assert(ChrootMgrGetErrorCode() == static_cast<int>(ErrorCode::TraceLogDirectoryBusy));

    // Someone that opened the lock file before we let go locks the same
    // file everybody else does.
    const int early = open((dir + "/" TRACE_LOCK_NAME).c_str(), O_RDWR);
    assert(early >= 0);
    lock.Release();
    assert(!lock.locked());
    assert(exists(dir + "/" TRACE_LOCK_NAME));
    assert(flock(early, LOCK_EX | LOCK_NB) == 0);
    ChrootMgrClearError();
    ScopedFileLock late;
    assert(PrepareTraceLogDirectory(dir, &late) < 0);
    assert(!late.locked());
    assert(ChrootMgrGetErrorCode() == static_cast<int>(ErrorCode::TraceLogDirectoryBusy));
    close(early);

    // Files we don't reconcile don't block anybody.
    write_file(dir + "/" TRACE_LOG_PREFIX ".abc", "stray\n");
    ScopedFileLock stray;
    assert(PrepareTraceLogDirectory(dir, &stray) == 0);
    stray.Release();

    // Raw files of an earlier session.
    write_file(dir + "/" TRACE_LOG_PREFIX ".4711", trace_of("/usr/bin/vim"));
    ChrootMgrClearError();
    ScopedFileLock stale;
    assert(PrepareTraceLogDirectory(dir, &stale) < 0);
    assert(!stale.locked());
    assert(ChrootMgrGetErrorCode() == static_cast<int>(ErrorCode::TraceLogDirectoryBusy));

    // Reconciled logs are fine.
    ReconcileReport report;
    assert(ReconcileTraceLogs(dir, DefaultIgnoreSet(), &report) == 0);
    ScopedFileLock clean;
    assert(PrepareTraceLogDirectory(dir, &clean) == 0);
    clean.Release();

    fs::remove_all(base);
}

static std::vector<std::string> list_dir(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

static mode_t mode_of(const std::string& path) {
    struct stat sb;
    assert(lstat(path.c_str(), &sb) == 0);
    return sb.st_mode & 07777;
}

static void check_tracer_launch_failure() {
    ChrootMgrClearError();
    int status = -7;
    assert(RunForegroundCommand({"/nonexistent/strace"}, ErrorCode::TracerLaunchFailed,
                                &status) == -1);
    assert(ChrootMgrGetErrorCode() == static_cast<int>(ErrorCode::TracerLaunchFailed));
    assert(status == -7);
    printf("%s\n", ChrootMgrGetErrorMsg());
}

// A stand-in tracer: writes one trace file per "process" next to the prefix
// given with -o and exits like the session did.
static const char kFakeTracer[] =
    "#!/bin/sh\n"
    "printf '10:00:00.000001 execve(\"/usr/sbin/chroot\", [\"chroot\", \"%s\"], 0x7ffe /* 3 vars */) = 0\\n' \"$6\" > \"$4.11\"\n"
    "printf '10:00:00.000002 execve(\"/bin/ls\", [\"ls\"], 0x7ffe) = 0\\n' > \"$4.12\"\n"
    "printf '10:00:00.000003 exit_group(0) = ?\\n' > \"$4.13\"\n"
    "exit 3\n";

static void check_traced_session() {
    const std::string base = make_temp_dir();
    const std::string bin = base + "/bin";
    fs::create_directories(bin);
    write_file(bin + "/strace", kFakeTracer);
    assert(chmod((bin + "/strace").c_str(), 0755) == 0);

    const char* old_path = getenv("PATH");
    const std::string saved_path = old_path ? old_path : "/usr/bin:/bin";
    setenv("PATH", (bin + ":" + saved_path).c_str(), 1);
    unsetenv("SUDO_USER");

    Options opt;
    opt.jail_root = base + "/jail";
    opt.trace_log_dir = base + "/logs";
    opt.ignore_set = DefaultIgnoreSet();

    ChrootMgrClearError();
    int exit_status = -1;
    assert(RunTracedSession(opt, &exit_status) == 0);
    assert(exit_status == 3);
    setenv("PATH", saved_path.c_str(), 1);

    const std::vector<std::string> expected = {TRACE_LOCK_NAME, "chroot_11.log",
                                               "pid13_13.log"};
    assert(list_dir(opt.trace_log_dir) == expected);
    assert(mode_of(opt.trace_log_dir) == 0755);
    assert(mode_of(opt.trace_log_dir + "/chroot_11.log") == 0644);

    // The directory is free again.
    ScopedFileLock lock;
    assert(PrepareTraceLogDirectory(opt.trace_log_dir, &lock) == 0);
    lock.Release();

    fs::remove_all(base);
}

int main() {
    // The tracer must not try to take over a terminal.
    assert(freopen("/dev/null", "r", stdin) != nullptr);

    check_reconcile();
    check_custom_ignore_set();
    check_missing_directory();
    check_tracer_command();
    check_log_dir_busy();
    check_tracer_launch_failure();
    check_traced_session();
    printf("reconciler checks passed\n");
    return 0;
}
