#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace routine::db {

// Backend-neutral outcome of a repository call. SQLite codes never leak
// past the repository.
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace routine::db
