#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace txcoord::util {

/*
  Central error types.

  Drivers translate native failures into these (see ClassifySqlState and
  Raise in db/api/result.hpp), so coordinators can choose abort / retry /
  escalate by type instead of by message text.
*/

class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend rejected an XA / 2PC statement (duplicate xid, wrong branch state).
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller drove a session through an illegal transition. Never retried.
class InvalidState : public ProtocolError {
 public:
  explicit InvalidState(const std::string& msg) : ProtocolError(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetryableConflict : public std::runtime_error {
 public:
  explicit RetryableConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetryExhausted : public std::runtime_error {
 public:
  RetryExhausted(const std::string& msg, std::uint32_t attempts) : std::runtime_error(msg), attempts_(attempts) {
  }

  std::uint32_t Attempts() const {
    return attempts_;
  }

 private:
  std::uint32_t attempts_;
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Fatal : public std::runtime_error {
 public:
  explicit Fatal(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace txcoord::util
