/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <assert.h>

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "src/main/tools/chroot-manager-options.h"
#include "src/main/tools/process-tools.h"

static ParseResult parse(std::vector<std::string> args, Options* opt) {
    args.insert(args.begin(), "chroot-manager");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return ParseOptions(static_cast<int>(args.size()), argv.data(), opt);
}

static void check_defaults() {
    Options opt;
    assert(parse({"status"}, &opt) == PARSE_OK);
    assert(opt.command == CMD_STATUS);
    assert(opt.jail_root == "/var/chroot");
    assert(opt.mirror == "http://deb.debian.org/debian");
    assert(opt.suite == "stable");
    assert(opt.log_file == "/var/log/chroot_manager.log");
    assert(opt.trace_log_dir == GetCurrentWorkingDirectory() + "/chroot_daemon_logs");
    assert(!opt.verbose && !opt.daemon);
    assert(opt.ignore_set == DefaultIgnoreSet());
    assert(opt.ignore_set.size() == 8);
    assert(opt.ignore_set.count("bash") && opt.ignore_set.count("umount"));
    assert(opt.original_args.size() == 2 && opt.original_args[1] == "status");
}

static void check_commands() {
    const std::vector<std::pair<std::string, Command>> commands = {
        {"create", CMD_CREATE}, {"connect", CMD_CONNECT},
        {"disconnect", CMD_DISCONNECT}, {"status", CMD_STATUS},
        {"install", CMD_INSTALL}, {"uninstall", CMD_UNINSTALL},
        {"help", CMD_HELP}};
    for (const auto& c : commands) {
        Options opt;
        assert(parse({c.first}, &opt) == PARSE_OK);
        assert(opt.command == c.second);
        assert(c.first == CommandName(c.second));
    }

    assert(CommandNeedsRoot(CMD_CONNECT));
    assert(CommandNeedsRoot(CMD_UNINSTALL));
    assert(!CommandNeedsRoot(CMD_STATUS));
    assert(!CommandNeedsRoot(CMD_HELP));
}

static void check_flags() {
    Options opt;
    assert(parse({"--verbose", "--daemon", "connect", "-r", "/srv/jail/",
                  "-l", "/tmp/traces", "-i", "vim", "--ignore=python3",
                  "-m", "http://mirror.example/debian", "-s", "bookworm",
                  "-L", "/tmp/cm.log"}, &opt) == PARSE_OK);
    assert(opt.command == CMD_CONNECT);
    assert(opt.verbose && opt.daemon);
    assert(opt.jail_root == "/srv/jail");
    assert(opt.trace_log_dir == "/tmp/traces");
    assert(opt.ignore_set.count("vim") && opt.ignore_set.count("python3"));
    assert(opt.ignore_set.count("ls"));
    assert(opt.mirror == "http://mirror.example/debian");
    assert(opt.suite == "bookworm");
    assert(opt.log_file == "/tmp/cm.log");

    Options rel;
    assert(parse({"-v", "-d", "-r", "jail", "status"}, &rel) == PARSE_OK);
    assert(rel.jail_root == GetCurrentWorkingDirectory() + "/jail");
}

static void check_errors() {
    Options opt;
    assert(parse({}, &opt) == PARSE_ERROR);

    Options unknown;
    assert(parse({"destroy"}, &unknown) == PARSE_ERROR);

    Options flag;
    assert(parse({"--frobnicate", "status"}, &flag) == PARSE_ERROR);

    Options two;
    assert(parse({"connect", "status"}, &two) == PARSE_ERROR);

    Options none;
    assert(parse({"--verbose"}, &none) == PARSE_ERROR);

    Options missing;
    assert(parse({"status", "-r"}, &missing) == PARSE_ERROR);

    Options slash;
    assert(parse({"-i", "/bin/ls", "status"}, &slash) == PARSE_ERROR);

    Options help;
    assert(parse({"--help"}, &help) == PARSE_EXIT_SUCCESS);

    Options version;
    assert(parse({"-V"}, &version) == PARSE_EXIT_SUCCESS);
    assert(version.print_version);
}

static void check_argument_file() {
    char tmpl[] = "/tmp/chroot_mgr_args_XXXXXX";
    int fd = mkstemp(tmpl);
    assert(fd >= 0);
    close(fd);
    std::ofstream(tmpl) << "--daemon\n\n-r\n/opt/jail\nconnect\n";

    Options opt;
    assert(parse({"-v", std::string("@") + tmpl}, &opt) == PARSE_OK);
    assert(opt.verbose && opt.daemon);
    assert(opt.jail_root == "/opt/jail");
    assert(opt.command == CMD_CONNECT);
    unlink(tmpl);

    Options missing;
    assert(parse({std::string("@") + tmpl}, &missing) == PARSE_ERROR);
}

int main() {
    check_defaults();
    check_commands();
    check_flags();
    check_errors();
    check_argument_file();
    printf("option parsing checks passed\n");
    return 0;
}
