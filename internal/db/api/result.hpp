#pragma once

#include <string>
#include <string_view>

namespace txcoord::db {

/*
  Portable DB error codes.

  Every driver classifies its native failures into these, then raises the
  matching util:: exception through Raise(). Upper layers never depend on
  pqxx / libmysqlclient / sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ProtocolViolation,

  SerializationFailure,
  Busy,

  ConnectionLost,

  Unsupported,
  InternalError
};

std::string_view ToString(ErrorCode code);

// PostgreSQL / CockroachDB SQLSTATE, plus MySQL's XA-specific states.
ErrorCode ClassifySqlState(std::string_view sqlstate);

// MySQL client/server errno; falls back to the SQLSTATE table.
ErrorCode ClassifyMySqlError(unsigned int error_number, std::string_view sqlstate);

// Throws the util:: exception matching `code`. OK is a programming error.
[[noreturn]] void Raise(ErrorCode code, const std::string& message);

} // namespace txcoord::db
