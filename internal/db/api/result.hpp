#pragma once

#include <string>
#include <utility>

namespace entitystore::db {

/*
  Portable DB result codes.

  Backends must translate their native errors into these.
  Upper layers should never depend on sqlite error types.
*/

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

const char* ToString(ErrorCode code);

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

// Throws the matching util error (AlreadyExists, NotFound, BackendError) unless ok.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace entitystore::db
