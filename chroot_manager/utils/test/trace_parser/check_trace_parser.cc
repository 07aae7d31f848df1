/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include <sstream>
#include <string>

#include "src/main/tools/trace-parser.h"

static void check_well_formed() {
    std::string path;
    assert(ParseExecveLine("execve(\"/usr/bin/vim\", [\"vim\"], 0x7ffd /* 20 vars */) = 0", &path));
    assert(path == "/usr/bin/vim");

    path.clear();
    assert(ParseExecveLine("10:41:07.123456 execve(\"/bin/ls\", [\"ls\", \"-l\"], 0x55 /* 9 vars */) = 0", &path));
    assert(path == "/bin/ls");

    path.clear();
    assert(ParseExecveLine("[pid  4242] 10:41:07.123456 execve(\"/bin/cat\", [\"cat\"], 0x55) = 0", &path));
    assert(path == "/bin/cat");

    // A failed lookup is still the first program the process tried.
    path.clear();
    assert(ParseExecveLine("10:41:07.000001 execve(\"/usr/local/bin/ls\", [\"ls\"], 0x55) = -1 ENOENT (No such file or directory)", &path));
    assert(path == "/usr/local/bin/ls");

    path.clear();
    assert(ParseExecveLine("10:41:07.000001 execve(\"/bin/bash\", [\"bash\"], 0x55 <unfinished ...>", &path));
    assert(path == "/bin/bash");
}

static void check_escapes() {
    std::string path;
    assert(ParseExecveLine("execve(\"/tmp/a\\\"b\\\\c\", [], 0x0) = 0", &path));
    assert(path == "/tmp/a\"b\\c");

    assert(ParseExecveLine("execve(\"/tmp/tab\\there\\n\", [], 0x0) = 0", &path));
    assert(path == "/tmp/tab\there\n");

    assert(ParseExecveLine("execve(\"/tmp/\\303\\251t\\xc3\\xa9\", [], 0x0) = 0", &path));
    assert(path == "/tmp/\xc3\xa9t\xc3\xa9");

    assert(ParseExecveLine("execve(\"\\x41\\101\", [], 0x0) = 0", &path));
    assert(path == "AA");
}

static void check_rejected() {
    std::string path = "untouched";

    // Closing quote missing.
    assert(!ParseExecveLine("10:41:07.123456 execve(\"/usr/bin/vi", &path));
    assert(!ParseExecveLine("execve(\"/usr/bin/vi\\\"", &path));
    // Ends in the middle of an escape.
    assert(!ParseExecveLine("execve(\"/usr/bin/vi\\", &path));

    // Resumed calls carry no path.
    assert(!ParseExecveLine("10:41:07.123456 <... execve resumed>) = 0", &path));
    assert(!ParseExecveLine("[pid  12] 10:41:07.123456 <... execve resumed>, 0x55) = 0", &path));

    // Other syscalls, even if they mention execve.
    assert(!ParseExecveLine("10:41:07.123456 openat(AT_FDCWD, \"execve(\\\"x\\\")\", O_RDONLY) = 3", &path));
    assert(!ParseExecveLine("10:41:07.123456 execveat(3, \"/bin/ls\", [], 0x0, 0) = 0", &path));
    assert(!ParseExecveLine("10:41:07.123456 write(1, \"execve(\", 7) = 7", &path));

    // First argument not a string.
    assert(!ParseExecveLine("10:41:07.123456 execve(0x55d1c0, [\"ls\"], 0x0) = -1 EFAULT (Bad address)", &path));
    assert(!ParseExecveLine("10:41:07.123456 execve(NULL, [], 0x0) = -1", &path));

    // Broken prefixes.
    assert(!ParseExecveLine("[pid] execve(\"/bin/ls\", [], 0x0) = 0", &path));
    assert(!ParseExecveLine("[pid 12 execve(\"/bin/ls\", [], 0x0) = 0", &path));
    assert(!ParseExecveLine("10:41:07.123456execve(\"/bin/ls\", [], 0x0) = 0", &path));

    assert(!ParseExecveLine("", &path));
    assert(!ParseExecveLine("execve(", &path));
    assert(!ParseExecveLine("+++ exited with 0 +++", &path));
    assert(!ParseExecveLine("--- SIGCHLD {si_signo=SIGCHLD} ---", &path));

    assert(path == "untouched");
}

static void check_first_match() {
    std::istringstream in(
        "10:41:07.000001 <... execve resumed>) = 0\n"
        "10:41:07.000002 execve(0x1, [], 0x0) = -1 EFAULT (Bad address)\n"
        "10:41:07.000003 execve(\"/usr/bin/python3\n"
        "10:41:07.000004 brk(NULL) = 0x55\n"
        "10:41:07.000005 execve(\"/usr/bin/vim\", [\"vim\"], 0x55) = 0\n"
        "10:41:07.000006 execve(\"/bin/sh\", [\"sh\"], 0x55) = 0\n");
    std::string path;
    assert(FindFirstExecvePath(in, &path));
    assert(path == "/usr/bin/vim");

    std::istringstream none(
        "10:41:07.000001 brk(NULL) = 0x55\n"
        "10:41:07.000002 exit_group(0) = ?\n"
        "10:41:07.000003 +++ exited with 0 +++\n");
    path.clear();
    assert(!FindFirstExecvePath(none, &path));
    assert(path.empty());

    std::istringstream empty("");
    assert(!FindFirstExecvePath(empty, &path));
}

int main() {
    check_well_formed();
    check_escapes();
    check_rejected();
    check_first_match();
    printf("trace parser checks passed\n");
    return 0;
}
