/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/trace-parser.h"

#include <ctype.h>
#include <string.h>

#include <string>

static const char kSyscall[] = "execve(";

static bool IsBlank(char c) { return c == ' ' || c == '\t'; }

static bool IsTimestampChar(char c) {
  return isdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
}

static void SkipBlanks(const std::string& line, size_t* pos) {
  while (*pos < line.size() && IsBlank(line[*pos])) {
    (*pos)++;
  }
}

// Consumes one "[pid N] " or timestamp prefix, including the blanks after it.
static bool SkipPrefix(const std::string& line, size_t* pos) {
  size_t i = *pos;
  if (line.compare(i, 4, "[pid") == 0) {
    i += 4;
    size_t start = i;
    SkipBlanks(line, &i);
    if (i == start) {
      return false;
    }
    start = i;
    while (i < line.size() && isdigit(static_cast<unsigned char>(line[i]))) {
      i++;
    }
    if (i == start || i >= line.size() || line[i] != ']') {
      return false;
    }
    i++;
  } else {
    size_t start = i;
    while (i < line.size() && IsTimestampChar(line[i])) {
      i++;
    }
    if (i == start) {
      return false;
    }
  }

  // A prefix is always followed by something.
  size_t end = i;
  SkipBlanks(line, &i);
  if (i == end) {
    return false;
  }
  *pos = i;
  return true;
}

static int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Decodes the C string literal whose opening quote is at line[pos]. Fails if
// the closing quote is missing.
static bool DecodeQuoted(const std::string& line, size_t pos,
                         std::string* out) {
  std::string res;
  size_t i = pos + 1;

  while (i < line.size()) {
    char c = line[i++];
    if (c == '"') {
      out->swap(res);
      return true;
    }
    if (c != '\\') {
      res.push_back(c);
      continue;
    }
    if (i >= line.size()) {
      return false;
    }

    c = line[i++];
    switch (c) {
      case 'n': res.push_back('\n'); break;
      case 't': res.push_back('\t'); break;
      case 'r': res.push_back('\r'); break;
      case 'v': res.push_back('\v'); break;
      case 'f': res.push_back('\f'); break;
      case 'a': res.push_back('\a'); break;
      case 'b': res.push_back('\b'); break;
      case 'x': {
        int value = 0;
        int digits = 0;
        while (digits < 2 && i < line.size() && HexValue(line[i]) >= 0) {
          value = value * 16 + HexValue(line[i]);
          i++;
          digits++;
        }
        if (digits == 0) {
          return false;
        }
        res.push_back(static_cast<char>(value));
        break;
      }
      default:
        if (c >= '0' && c <= '7') {
          int value = c - '0';
          int digits = 1;
          while (digits < 3 && i < line.size() && line[i] >= '0' &&
                 line[i] <= '7') {
            value = value * 8 + (line[i] - '0');
            i++;
            digits++;
          }
          res.push_back(static_cast<char>(value & 0xff));
        } else {
          // \" \\ and anything unknown stand for themselves.
          res.push_back(c);
        }
        break;
    }
  }
  return false;
}


bool ParseExecveLine(const std::string& line, std::string* path) {
  size_t pos = 0;
  SkipBlanks(line, &pos);
  while (pos < line.size() && line.compare(pos, strlen(kSyscall), kSyscall) != 0) {
    if (!SkipPrefix(line, &pos)) {
      return false;
    }
  }

  if (line.compare(pos, strlen(kSyscall), kSyscall) != 0) {
    return false;
  }
  pos += strlen(kSyscall);
  if (pos >= line.size() || line[pos] != '"') {
    return false;
  }
  return DecodeQuoted(line, pos, path);
}


bool FindFirstExecvePath(std::istream& in, std::string* path) {
  for (std::string line; std::getline(in, line);) {
    if (ParseExecveLine(line, path)) {
      return true;
    }
  }
  return false;
}
