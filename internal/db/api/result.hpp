#pragma once

#include <stdexcept>
#include <string>

namespace syncq::db {

/*
  Portable DB result codes.

  The store layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

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
};

const char* ToString(ErrorCode code);

/*
  Thrown where a Result cannot be returned: opening connections,
  BEGIN/COMMIT, and pool exhaustion.
*/
class DbError : public std::runtime_error {
 public:
  explicit DbError(Result result) : std::runtime_error(result.message), result_(std::move(result)) {
  }

  const Result& result() const {
    return result_;
  }

 private:
  Result result_;
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Conflict:
      return "Conflict";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
}

} // namespace syncq::db
