#pragma once

#include <string>
#include <utility>

namespace devinv::core::common::error {

enum class ErrorCode {
  Ok,
  Validation,
  NotFound,
  DuplicateKey,
  Conflict,
  Unavailable,
  StorageFailure,
  Internal
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok: return "ok";
    case ErrorCode::Validation: return "validation";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::DuplicateKey: return "duplicate_key";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Unavailable: return "unavailable";
    case ErrorCode::StorageFailure: return "storage_failure";
    case ErrorCode::Internal: return "internal";
  }
  return "internal";
}

// Outcome of an operation that can fail in an expected way. `message` is the
// user-facing summary, `details` the underlying cause (may be empty).
struct Status {
  ErrorCode code = ErrorCode::Ok;
  std::string message;
  std::string details;

  bool IsOk() const { return code == ErrorCode::Ok; }

  static Status Ok() { return Status{}; }

  static Status Error(ErrorCode code, std::string message, std::string details = std::string()) {
    Status s;
    s.code = code;
    s.message = std::move(message);
    s.details = std::move(details);
    return s;
  }
};

}  // namespace devinv::core::common::error
