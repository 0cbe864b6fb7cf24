#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace checkpoint::db {

/*
  Outcome of a manifest repository write.

  Backends map their native failures onto ErrorCode; SnapshotManifest turns
  the codes into the exceptions callers see.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict, // concurrent commit touched the same manifest
  Busy,     // lock not acquired within the busy timeout

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  std::string Describe() const {
    if (message.empty()) {
      return std::string(ToString(code));
    }
    return std::string(ToString(code)) + ": " + message;
  }
};

} // namespace checkpoint::db
