/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef _ERROR_HANDLING_H
#define _ERROR_HANDLING_H

#include <cstdio>
#include <cerrno>
#include <string>
#include <cstring>
#include <cstdarg>

#define MAX_ERR_LEN 255

#define UNRECOVERABLE_FAIL -1
#define RECOVERABLE_FAIL -2
#define RECOVERABLE_ERROR_CODES -200


enum class ErrorCode : int {
  None = 0,
  NotRoot = -1,
  MissingDependency = -2,
  JailDoesNotExist = -3,
  JailAlreadyExists = -4,
  MountFailed = -5,
  TracerLaunchFailed = -6,
  TraceLogDirectoryBusy = -7,
  CommandFailed = -8,
  SessionCancelled = -9,
  InstallFailed = -10,
  InvalidCommand = -11,
  GeneralOSError = -100,
  // Error codes from -201 are recoverables
  UnmountFailed = -201,
  ReconcileFailed = -202,
  OwnershipFailed = -203,
  Unknown = -1000
};

inline std::string GetErrorMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "No error";
    case ErrorCode::NotRoot:
      return "Must be run as root (use sudo)";
    case ErrorCode::MissingDependency:
      return "Required command is not installed";
    case ErrorCode::JailDoesNotExist:
      return "Chroot jail does not exist";
    case ErrorCode::JailAlreadyExists:
      return "Chroot jail already exists";
    case ErrorCode::MountFailed:
      return "Error mounting";
    case ErrorCode::TracerLaunchFailed:
      return "Could not launch the traced session";
    case ErrorCode::TraceLogDirectoryBusy:
      return "Trace log directory is in use by another session";
    case ErrorCode::CommandFailed:
      return "External command failed";
    case ErrorCode::SessionCancelled:
      return "Session cancelled by signal";
    case ErrorCode::InstallFailed:
      return "Installation failed";
    case ErrorCode::InvalidCommand:
      return "Invalid command";
    case ErrorCode::GeneralOSError:
      return "OS Error";
    case ErrorCode::UnmountFailed:
      return "Error unmounting";
    case ErrorCode::ReconcileFailed:
      return "Could not reconcile trace log";
    case ErrorCode::OwnershipFailed:
      return "Could not normalize ownership";
    case ErrorCode::Unknown:
    default:
      return "Unknown error occurred";
  }
}

typedef struct {
  char msg[MAX_ERR_LEN];
  ErrorCode code;
} ChrootMgrError;

#define ChrootMgrReportError(code) \
    ChrootMgrReportError_impl((code), __FILE__, __LINE__, __func__)

int ChrootMgrReportError_impl(ErrorCode code, const char* file, int line, const char* func);

#define ChrootMgrReportErrorAndMessage(msg, code) \
    ChrootMgrReportErrorAndMessage_impl((msg), (code), __FILE__, __LINE__, __func__)

int ChrootMgrReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, const char* file, int line, const char* func);

// printf-style report of a GeneralOSError.
int ChrootMgrReport(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

bool IsRecoverable(ErrorCode code);
void ChrootMgrClearError();
ChrootMgrError ChrootMgrGetLastError();
const char* ChrootMgrGetErrorMsg();
int ChrootMgrGetErrorCode();

#endif
