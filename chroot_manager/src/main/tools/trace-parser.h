/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TRACE_PARSER_H_
#define SRC_MAIN_TOOLS_TRACE_PARSER_H_

#include <istream>
#include <string>

// Parses one line of strace output. Accepts
//
//   line      := prefix* 'execve' '(' '"' c-escaped-chars '"' rest
//   prefix    := '[pid' ws+ digits ']' ws+ | timestamp ws+
//   timestamp := [0-9:.]+
//
// and stores the decoded first argument into `path`. Any other syscall, a
// resumed call, a non-string first argument or a string without its closing
// quote is rejected and `path` is left untouched.
bool ParseExecveLine(const std::string& line, std::string* path);

// Returns the path of the first line of `in` that ParseExecveLine accepts.
bool FindFirstExecvePath(std::istream& in, std::string* path);

#endif  // SRC_MAIN_TOOLS_TRACE_PARSER_H_
