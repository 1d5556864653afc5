#pragma once

#include <atomic>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace txcoord::db {

/*
  One exclusive backend session.

  Not thread-safe: a connection is owned by exactly one caller at a time
  (an XaSession, a retry attempt, or a recovery call) and handed back to
  the pool when that owner lets go.

  Every method throws the util:: error family (see api/result.hpp);
  native driver exceptions never escape an implementation.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool IsHealthy() const = 0;

  // Raw statement, sent as-is (XA control statements, BEGIN/COMMIT, SET ...).
  virtual void Execute(const std::string& sql) = 0;

  virtual void Execute(const std::string& sql, const sql::Params& params) = 0;

  virtual sql::ResultSet Query(const std::string& sql, const sql::Params& params = {}) = 0;

  virtual sql::PlaceholderStyle Placeholders() const = 0;

  // A poisoned connection is destroyed instead of being returned to the
  // pool: its backend session may still carry an open branch.
  void Poison() {
    poisoned_.store(true);
  }

  bool IsPoisoned() const {
    return poisoned_.load();
  }

 private:
  std::atomic<bool> poisoned_{false};
};

} // namespace txcoord::db
