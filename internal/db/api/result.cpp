#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace entitystore::db {

const char* ToString(ErrorCode code) {
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
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    default:
      throw util::BackendError(message + " (" + ToString(result.code) + ")");
  }
}

} // namespace entitystore::db
