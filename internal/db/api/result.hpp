#pragma once

#include <string>

namespace casetrack::db {

/*
  Portable store result codes.

  Every backend translates its native errors (sqlite rc, pqxx exceptions)
  into these. Components never depend on backend error types.

  Conflict means a conditional write found the row in an unexpected state
  (wrong status, wrong holder, stale version).
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

/*
  Translates a failed Result into the component error taxonomy.

    NotFound                  -> util::NotFound
    Conflict / Serialization  -> util::ConcurrentModification
    anything else             -> util::StoreUnavailable

  AlreadyExists is left to callers since its meaning depends on the table;
  if it reaches here it is reported as ConcurrentModification.
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace casetrack::db
