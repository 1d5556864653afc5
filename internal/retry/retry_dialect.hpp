#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace txcoord::retry {

enum class TransactionPriority {
  kLow,
  kNormal,
  kHigh,
};

std::string_view ToString(TransactionPriority priority);

// Accepts LOW / NORMAL / HIGH in any case; throws std::invalid_argument.
TransactionPriority ParsePriority(std::string_view text);

struct ClusterInfo {
  std::string              version; // always starts with 'v'
  std::string              server_version;
  std::vector<std::string> regions;
};

/*
  RetryDialect

  Capabilities of one optimistic backend. Conflict classification itself
  happens in the drivers, which raise util::RetryableConflict for the
  backend's retryable error class; the dialect supplies the statements
  around a unit of work and the optional features.
*/
class RetryDialect {
 public:
  virtual ~RetryDialect() = default;

  virtual std::string_view Name() const = 0;

  virtual std::string BeginSql() const {
    return "BEGIN";
  }

  virtual std::string CommitSql() const {
    return "COMMIT";
  }

  virtual std::string RollbackSql() const {
    return "ROLLBACK";
  }

  virtual bool SupportsPriority() const = 0;
  // Issued right after BeginSql. Throws util::Unsupported when absent.
  virtual std::string PrioritySql(TransactionPriority priority) const = 0;

  // Throws util::Unsupported when the backend has no historical reads.
  virtual std::string AsOfSystemTimeSql(std::string_view query, std::string_view interval) const = 0;

  virtual ClusterInfo ReadClusterInfo(db::Connection& connection) const = 0;
};

// Returns `server_version` reduced to a "v<major>..." token: the first
// token already of that form, else the first token starting with a
// digit prefixed with 'v', else "v" + the whole text.
std::string NormalizeVersion(std::string_view server_version);

// CockroachDB: SQLSTATE 40001 retries, SET TRANSACTION PRIORITY,
// AS OF SYSTEM TIME, SHOW REGIONS.
class CockroachDialect final : public RetryDialect {
 public:
  std::string_view Name() const override {
    return "cockroach";
  }

  bool SupportsPriority() const override {
    return true;
  }

  std::string PrioritySql(TransactionPriority priority) const override;
  std::string AsOfSystemTimeSql(std::string_view query, std::string_view interval) const override;
  ClusterInfo ReadClusterInfo(db::Connection& connection) const override;
};

// SQLite: SQLITE_BUSY / SQLITE_LOCKED retries. BEGIN IMMEDIATE takes the
// write lock up front so contention surfaces at begin, not mid-work.
class SqliteRetryDialect final : public RetryDialect {
 public:
  std::string_view Name() const override {
    return "sqlite";
  }

  std::string BeginSql() const override {
    return "BEGIN IMMEDIATE";
  }

  bool SupportsPriority() const override {
    return false;
  }

  std::string PrioritySql(TransactionPriority priority) const override;
  std::string AsOfSystemTimeSql(std::string_view query, std::string_view interval) const override;
  ClusterInfo ReadClusterInfo(db::Connection& connection) const override;
};

} // namespace txcoord::retry
