#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace creditgate::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw creditgate::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw creditgate::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
    case ErrorCode::Busy:
      throw creditgate::util::Conflict(message);
    default:
      throw creditgate::util::StorageError(message + " (" + ToString(result.code) + ")");
  }
}

} // namespace creditgate::db
