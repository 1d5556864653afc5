#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace txcoord::db {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ProtocolViolation:
      return "protocol_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConnectionLost:
      return "connection_lost";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

ErrorCode ClassifySqlState(std::string_view sqlstate) {
  if (sqlstate.size() != 5) return ErrorCode::InternalError;

  // serialization_failure, deadlock_detected
  if (sqlstate == "40001" || sqlstate == "40P01") return ErrorCode::SerializationFailure;
  // lock_not_available
  if (sqlstate == "55P03") return ErrorCode::Busy;

  // undefined_object: COMMIT/ROLLBACK PREPARED of an unknown gid
  if (sqlstate == "42704") return ErrorCode::NotFound;
  // duplicate_object: PREPARE TRANSACTION with a gid already in use
  if (sqlstate == "42710") return ErrorCode::AlreadyExists;
  // object_not_in_prerequisite_state: e.g. max_prepared_transactions = 0
  if (sqlstate == "55000") return ErrorCode::ProtocolViolation;
  if (sqlstate == "0A000") return ErrorCode::Unsupported;

  // MySQL XA states
  if (sqlstate == "XAE04") return ErrorCode::NotFound;
  if (sqlstate == "XAE08") return ErrorCode::AlreadyExists;

  const auto klass = sqlstate.substr(0, 2);
  if (klass == "08") return ErrorCode::ConnectionLost;
  if (klass == "57" && sqlstate != "57014") return ErrorCode::ConnectionLost;
  if (klass == "25" || klass == "XA") return ErrorCode::ProtocolViolation;

  return ErrorCode::InternalError;
}

ErrorCode ClassifyMySqlError(unsigned int error_number, std::string_view sqlstate) {
  switch (error_number) {
    case 1397: // ER_XAER_NOTA
      return ErrorCode::NotFound;
    case 1440: // ER_XAER_DUPID
      return ErrorCode::AlreadyExists;
    case 1398: // ER_XAER_INVAL
    case 1399: // ER_XAER_RMFAIL
    case 1400: // ER_XAER_OUTSIDE
    case 1401: // ER_XAER_RMERR
    case 1402: // ER_XA_RBROLLBACK
    case 1613: // ER_XA_RBTIMEOUT
    case 1614: // ER_XA_RBDEADLOCK
      return ErrorCode::ProtocolViolation;
    case 1213: // ER_LOCK_DEADLOCK
      return ErrorCode::SerializationFailure;
    case 1205: // ER_LOCK_WAIT_TIMEOUT
      return ErrorCode::Busy;
    case 2002: // CR_CONNECTION_ERROR
    case 2003: // CR_CONN_HOST_ERROR
    case 2006: // CR_SERVER_GONE_ERROR
    case 2013: // CR_SERVER_LOST
    case 2055: // CR_SERVER_LOST_EXTENDED
      return ErrorCode::ConnectionLost;
    default:
      break;
  }
  return ClassifySqlState(sqlstate);
}

void Raise(ErrorCode code, const std::string& message) {
  switch (code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ProtocolViolation:
      throw util::ProtocolError(message);
    case ErrorCode::SerializationFailure:
    case ErrorCode::Busy:
      throw util::RetryableConflict(message);
    case ErrorCode::ConnectionLost:
      throw util::ConnectionError(message);
    case ErrorCode::Unsupported:
      throw util::Unsupported(message);
    case ErrorCode::OK:
      throw util::Fatal("Raise called with ErrorCode::OK: " + message);
    case ErrorCode::InternalError:
      break;
  }
  throw util::Fatal(message);
}

} // namespace txcoord::db
