#pragma once

#include <string>
#include <utility>

namespace sensorweave::db {

// Backend-neutral outcome of a repository write. Backends translate their
// native errors (sqlite result codes, replay conflicts) into these codes.
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // memory backend: the transaction was already finished or its redo log no longer applies
  Conflict,
  // sqlite: SQLITE_BUSY / SQLITE_LOCKED after the busy timeout
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

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace sensorweave::db
