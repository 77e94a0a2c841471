#pragma once

#include <string>

namespace creditgate::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  Conflict is reserved for compare-and-swap misses (row exists, version
  moved). NotFound means the row is gone. Callers rely on the difference.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
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

  // Duplicate insert on a unique key, however the backend spells it.
  bool IsDuplicate() const {
    return code == ErrorCode::AlreadyExists || code == ErrorCode::ConstraintViolation;
  }
};

const char* ToString(ErrorCode code);

// Maps a failed Result onto the util:: exception hierarchy. No-op on success.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace creditgate::db
