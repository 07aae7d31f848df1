/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <vector>


static ChrootMgrError mgr_err;


static void GenErrorMessage(const std::string& err_msg, const char* file,
                                          int line, const char* func, std::string& out) {
  out = "[" + std::string(func) + ":" + std::to_string(line) + "]: "  + err_msg;
}


bool IsRecoverable(ErrorCode code) {
  return static_cast<int>(code) < RECOVERABLE_ERROR_CODES;
}


// Errors are recorded and logged, never turned into an exit() here: the
// callers unwind to main so that the mount session can clean up.
static int ChrootMgrSetError(const std::string& log_msg, const std::string& err_msg, ErrorCode code) {
  PRINT_ERROR("%s", log_msg.c_str());

  memset(mgr_err.msg, 0, MAX_ERR_LEN);
  strncpy(mgr_err.msg, err_msg.c_str(), MAX_ERR_LEN - 1);
  mgr_err.msg[MAX_ERR_LEN - 1] = '\0';
  mgr_err.code = code;

  if (IsRecoverable(code))
    return RECOVERABLE_FAIL;
  return UNRECOVERABLE_FAIL;
}


int ChrootMgrReportError_impl(ErrorCode code, const char* file, int line, const char* func) {
  return ChrootMgrReportErrorAndMessage_impl("", code, file, line, func);
}


int ChrootMgrReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, const char* file, int line, const char* func) {
  std::string msg;
  std::string code_msg;

  code_msg = GetErrorMessage(code);
  if (!err_msg.empty())
    code_msg += ": " + err_msg;

  GenErrorMessage(code_msg, file, line, func, msg);
  PRINT_DEBUG("%s reported at %s:%d", GetErrorMessage(code).c_str(), file, line);
  return ChrootMgrSetError(code_msg, msg, code);
}


int ChrootMgrReport(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);

    int size = std::vsnprintf(nullptr, 0, fmt, args) + 1;
    va_end(args);
    if (size <= 0)
      return ChrootMgrSetError(fmt, fmt, ErrorCode::GeneralOSError);

    std::vector<char> buffer(size);
    va_start(args, fmt);
    std::vsnprintf(buffer.data(), size, fmt, args);
    va_end(args);

    std::string msg = std::string(buffer.data());
    return ChrootMgrSetError(msg, msg, ErrorCode::GeneralOSError);
}


void ChrootMgrClearError() {
  memset(mgr_err.msg, 0, MAX_ERR_LEN);
  mgr_err.code = ErrorCode::None;
}


ChrootMgrError ChrootMgrGetLastError() {
  return mgr_err;
}


const char* ChrootMgrGetErrorMsg() {
  return mgr_err.msg;
}

int ChrootMgrGetErrorCode() {
  return static_cast<int>(mgr_err.code);
}
