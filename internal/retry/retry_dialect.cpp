#include "retry_dialect.hpp"

#include <cctype>
#include <optional>
#include <stdexcept>

#include "internal/retry/as_of_system_time.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::retry {

std::string_view ToString(TransactionPriority priority) {
  switch (priority) {
    case TransactionPriority::kLow:
      return "LOW";
    case TransactionPriority::kNormal:
      return "NORMAL";
    case TransactionPriority::kHigh:
      return "HIGH";
  }
  return "NORMAL";
}

TransactionPriority ParsePriority(std::string_view text) {
  std::string upper;
  for (char c : text) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

  if (upper == "LOW") return TransactionPriority::kLow;
  if (upper == "NORMAL") return TransactionPriority::kNormal;
  if (upper == "HIGH") return TransactionPriority::kHigh;
  throw std::invalid_argument("unknown transaction priority: " + std::string(text));
}

std::string NormalizeVersion(std::string_view server_version) {
  std::optional<std::string_view> numeric;

  std::size_t pos = 0;
  while (pos < server_version.size()) {
    while (pos < server_version.size() && std::isspace(static_cast<unsigned char>(server_version[pos]))) ++pos;
    const auto start = pos;
    while (pos < server_version.size() && !std::isspace(static_cast<unsigned char>(server_version[pos]))) ++pos;
    const auto token = server_version.substr(start, pos - start);
    if (token.size() >= 2 && token[0] == 'v' && std::isdigit(static_cast<unsigned char>(token[1]))) {
      return std::string(token);
    }
    if (!numeric && !token.empty() && std::isdigit(static_cast<unsigned char>(token[0]))) {
      numeric = token;
    }
  }

  if (numeric) return "v" + std::string(*numeric);
  return "v" + std::string(server_version);
}

// ---------------------------------------------------------------------------
// CockroachDB
// ---------------------------------------------------------------------------

std::string CockroachDialect::PrioritySql(TransactionPriority priority) const {
  return "SET TRANSACTION PRIORITY " + std::string(ToString(priority));
}

std::string CockroachDialect::AsOfSystemTimeSql(std::string_view query, std::string_view interval) const {
  return RewriteAsOfSystemTime(query, interval);
}

ClusterInfo CockroachDialect::ReadClusterInfo(db::Connection& connection) const {
  ClusterInfo info;

  const auto version = connection.Query("SELECT version()");
  if (version.empty() || version.front().IsNull(0)) {
    throw util::Fatal("SELECT version() returned no row");
  }
  info.server_version = version.front().GetText(0);
  info.version        = NormalizeVersion(info.server_version);

  for (const auto& row : connection.Query("SHOW REGIONS")) {
    if (row.ColumnCount() > 0 && !row.IsNull(0)) {
      info.regions.push_back(row.GetText(0));
    }
  }
  return info;
}

// ---------------------------------------------------------------------------
// SQLite
// ---------------------------------------------------------------------------

std::string SqliteRetryDialect::PrioritySql(TransactionPriority) const {
  throw util::Unsupported("sqlite has no transaction priorities");
}

std::string SqliteRetryDialect::AsOfSystemTimeSql(std::string_view, std::string_view) const {
  throw util::Unsupported("sqlite has no historical reads (AS OF SYSTEM TIME)");
}

ClusterInfo SqliteRetryDialect::ReadClusterInfo(db::Connection& connection) const {
  const auto rows = connection.Query("SELECT sqlite_version()");
  if (rows.empty() || rows.front().IsNull(0)) {
    throw util::Fatal("SELECT sqlite_version() returned no row");
  }

  ClusterInfo info;
  info.server_version = rows.front().GetText(0);
  info.version        = NormalizeVersion(info.server_version);
  return info;
}

} // namespace txcoord::retry
