#pragma once

#include <string>

namespace supervisor::db {

/*
  Outcome of a repository write.

  Backends map driver errors onto these codes; nothing above the
  repository sees sqlite3 or pqxx error types. db_errors.hpp turns a
  failed Result into the util exception taxonomy.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,      // row addressed by id does not exist
  AlreadyExists, // duplicate instance, execution or (execution, sequence)
  Conflict,      // compare-and-swap lost: stored version moved

  // transient: the caller may retry with backoff
  Busy,
  SerializationFailure,
  IOError,

  ConstraintViolation,
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

} // namespace supervisor::db
