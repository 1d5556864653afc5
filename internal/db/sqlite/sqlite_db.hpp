#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"

namespace txcoord::db::sqlite {

struct SqliteOptions {
  std::string               path;
  // Time sqlite waits on a locked database before reporting SQLITE_BUSY,
  // which surfaces as util::RetryableConflict.
  std::chrono::milliseconds busy_timeout{5000};
};

/*
  Thin RAII wrapper around sqlite3*, exposed as a db::Connection.

  Every pool slot opens its own handle on the same file; WAL lets readers
  proceed while one writer holds the lock.
*/
class SqliteDB final : public db::Connection {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  bool IsHealthy() const override {
    return db_ != nullptr;
  }

  void Execute(const std::string& sql) override;
  void Execute(const std::string& sql, const sql::Params& params) override;
  sql::ResultSet Query(const std::string& sql, const sql::Params& params = {}) override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::kQuestionMark;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  [[noreturn]] void Fail(int rc, const std::string& what) const;

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

ErrorCode ClassifySqliteCode(int result_code);

} // namespace txcoord::db::sqlite
