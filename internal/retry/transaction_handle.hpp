#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/connection.hpp"

namespace txcoord::retry {

/*
  What a unit of work sees of its transaction.

  Valid only for the duration of one attempt. The manager owns BEGIN,
  COMMIT and ROLLBACK; work must not issue them itself.
*/
class TransactionHandle {
 public:
  TransactionHandle(db::Connection& connection, std::uint32_t attempt) : connection_(connection), attempt_(attempt) {
  }

  TransactionHandle(const TransactionHandle&)            = delete;
  TransactionHandle& operator=(const TransactionHandle&) = delete;

  void Execute(const std::string& sql, const db::sql::Params& params = {}) {
    if (params.empty()) {
      connection_.Execute(sql);
    } else {
      connection_.Execute(sql, params);
    }
  }

  db::sql::ResultSet Query(const std::string& sql, const db::sql::Params& params = {}) {
    return connection_.Query(sql, params);
  }

  db::sql::PlaceholderStyle Placeholders() const {
    return connection_.Placeholders();
  }

  // 1 for the first attempt.
  std::uint32_t Attempt() const {
    return attempt_;
  }

 private:
  db::Connection& connection_;
  std::uint32_t   attempt_;
};

} // namespace txcoord::retry
