// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Compatible with -fno-exceptions
//   - Driver errors are passed through with the driver's own message

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dbkit {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  // Descriptor scheme not recognized.
  kUnsupportedBackend = -20,
  // Semantically invalid combination of settings.
  kConfiguration = -21,
  // Indirect descriptor could not be followed.
  kResolution = -22,
  kDatabaseNotFound = -23,
  kConfirmationRequired = -24,
  kUnsupportedOperation = -25,
  kDeserialization = -26,
  kNotImplemented = -27,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "Ok";
    case ErrorCode::kError: return "Error";
    case ErrorCode::kNotOpen: return "NotOpen";
    case ErrorCode::kBusy: return "Busy";
    case ErrorCode::kNotFound: return "NotFound";
    case ErrorCode::kConstraint: return "Constraint";
    case ErrorCode::kMismatch: return "Mismatch";
    case ErrorCode::kMisuse: return "Misuse";
    case ErrorCode::kRange: return "Range";
    case ErrorCode::kNullParam: return "NullParam";
    case ErrorCode::kIoError: return "IoError";
    case ErrorCode::kFull: return "Full";
    case ErrorCode::kUnsupportedBackend: return "UnsupportedBackend";
    case ErrorCode::kConfiguration: return "Configuration";
    case ErrorCode::kResolution: return "Resolution";
    case ErrorCode::kDatabaseNotFound: return "DatabaseNotFound";
    case ErrorCode::kConfirmationRequired: return "ConfirmationRequired";
    case ErrorCode::kUnsupportedOperation: return "UnsupportedOperation";
    case ErrorCode::kDeserialization: return "Deserialization";
    case ErrorCode::kNotImplemented: return "NotImplemented";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  static Error Format(ErrorCode c, const char* fmt, ...) {
    Error e;
    e.code = c;
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(e.message, kMaxMessageLen, fmt, ap);
    va_end(ap);
    return e;
  }
};

/// Copy `err` into `*out_error` when the caller asked for it.
inline void Report(Error* out_error, const Error& err) {
  if (out_error != nullptr) { *out_error = err; }
}

}  // namespace dbkit
