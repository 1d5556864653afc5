#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/connection.hpp"

namespace txcoord::db::postgres {

/*
  PgConnection

  One libpqxx connection, used for PostgreSQL participants and for
  CockroachDB retry managers (same wire protocol).

  Design notes:
  -------------
  - libpqxx connections are NOT thread-safe; the pool hands each one to a
    single owner.
  - Statements run through short-lived pqxx::nontransaction objects so the
    caller drives BEGIN / PREPARE TRANSACTION / COMMIT itself. pqxx::work
    would wrap everything in its own transaction and hide the 2PC verbs.
*/
class PgConnection final : public db::Connection {
 public:
  explicit PgConnection(const std::string& conninfo);
  ~PgConnection() override;

  bool IsHealthy() const override;

  void Execute(const std::string& sql) override;
  void Execute(const std::string& sql, const sql::Params& params) override;
  sql::ResultSet Query(const std::string& sql, const sql::Params& params = {}) override;

  sql::PlaceholderStyle Placeholders() const override {
    return sql::PlaceholderStyle::kDollarNumbered;
  }

 private:
  pqxx::result Run(const std::string& sql, const sql::Params* params);

  std::unique_ptr<pqxx::connection> conn_;
};

} // namespace txcoord::db::postgres
