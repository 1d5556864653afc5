#include "xa_dialect.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/xa/xid_quoting.hpp"

namespace txcoord::xa {

TransactionInfo XaDialect::ParseRecovered(const db::sql::Row& row) const {
  if (row.ColumnCount() < 4) {
    throw util::Fatal("recovery row has " + std::to_string(row.ColumnCount()) + " columns, expected 4");
  }

  TransactionInfo info;
  info.format_id    = row.GetInt64(0);
  info.gtrid_length = row.GetInt64(1);
  info.bqual_length = row.GetInt64(2);
  info.data         = row.GetText(3);

  const auto gtrid = static_cast<std::size_t>(std::max<std::int64_t>(info.gtrid_length, 0));
  info.xid         = info.data.substr(0, std::min(gtrid, info.data.size()));
  return info;
}

// ---------------------------------------------------------------------------
// MySQL
// ---------------------------------------------------------------------------

std::string MySqlXaDialect::QuoteXid(std::string_view xid) const {
  return QuoteMySqlXid(xid);
}

std::string MySqlXaDialect::StartSql(std::string_view xid) const {
  return "XA START " + QuoteXid(xid);
}

std::string MySqlXaDialect::EndSql(std::string_view xid) const {
  return "XA END " + QuoteXid(xid);
}

std::string MySqlXaDialect::PrepareSql(std::string_view xid) const {
  return "XA PREPARE " + QuoteXid(xid);
}

std::string MySqlXaDialect::CommitSql(std::string_view xid) const {
  return "XA COMMIT " + QuoteXid(xid);
}

std::string MySqlXaDialect::CommitOnePhaseSql(std::string_view xid) const {
  return "XA COMMIT " + QuoteXid(xid) + " ONE PHASE";
}

std::vector<std::string> MySqlXaDialect::RollbackSql(std::string_view xid, XaState state) const {
  // An ACTIVE branch must be ended before the server accepts ROLLBACK.
  if (state == XaState::kStarted) {
    return {EndSql(xid), "XA ROLLBACK " + QuoteXid(xid)};
  }
  return {"XA ROLLBACK " + QuoteXid(xid)};
}

// ---------------------------------------------------------------------------
// PostgreSQL
// ---------------------------------------------------------------------------

std::string PostgresXaDialect::QuoteXid(std::string_view xid) const {
  return QuotePostgresXid(xid);
}

std::string PostgresXaDialect::StartSql(std::string_view xid) const {
  // Validate up front so an unrepresentable gid fails at begin, not at
  // prepare after the work is done.
  QuoteXid(xid);
  return "BEGIN";
}

std::string PostgresXaDialect::EndSql(std::string_view) const {
  return {};
}

std::string PostgresXaDialect::PrepareSql(std::string_view xid) const {
  return "PREPARE TRANSACTION " + QuoteXid(xid);
}

std::string PostgresXaDialect::CommitSql(std::string_view xid) const {
  return "COMMIT PREPARED " + QuoteXid(xid);
}

std::string PostgresXaDialect::CommitOnePhaseSql(std::string_view) const {
  return "COMMIT";
}

std::vector<std::string> PostgresXaDialect::RollbackSql(std::string_view xid, XaState state) const {
  if (state == XaState::kPrepared) {
    return {"ROLLBACK PREPARED " + QuoteXid(xid)};
  }
  return {"ROLLBACK"};
}

std::string PostgresXaDialect::RecoverSql() const {
  return "SELECT 0, octet_length(gid), 0, gid FROM pg_prepared_xacts WHERE database = current_database() ORDER BY prepared";
}

} // namespace txcoord::xa
