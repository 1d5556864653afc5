#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/sql/sql_row.hpp"
#include "internal/xa/transaction_info.hpp"
#include "internal/xa/xa_state.hpp"

namespace txcoord::xa {

/*
  XaDialect

  Statement set of one backend's two-phase protocol. Every statement is
  parameterized only by the xid, which the dialect quotes itself; the XA
  keywords require it inline, so it is never a bound parameter.

  Dialects are stateless and shared between participants.
*/
class XaDialect {
 public:
  virtual ~XaDialect() = default;

  virtual std::string_view Name() const = 0;

  // Complete quoted literal. Throws util::ProtocolError when the xid is
  // not representable on this backend.
  virtual std::string QuoteXid(std::string_view xid) const = 0;

  virtual std::string StartSql(std::string_view xid) const = 0;
  // Empty when the backend has no separate end-of-work statement.
  virtual std::string EndSql(std::string_view xid) const = 0;
  virtual std::string PrepareSql(std::string_view xid) const = 0;
  virtual std::string CommitSql(std::string_view xid) const = 0;
  virtual std::string CommitOnePhaseSql(std::string_view xid) const = 0;

  // Statements that abort a branch currently in `state`, in order.
  virtual std::vector<std::string> RollbackSql(std::string_view xid, XaState state) const = 0;

  // Whether RollbackSql accepts kStarted / kEnded.
  virtual bool AllowsRollbackBeforePrepare() const = 0;

  // Four columns: format id, gtrid length, bqual length, data.
  virtual std::string RecoverSql() const = 0;

  virtual TransactionInfo ParseRecovered(const db::sql::Row& row) const;
};

// MySQL / MariaDB XA.
class MySqlXaDialect final : public XaDialect {
 public:
  std::string_view Name() const override {
    return "mysql";
  }

  std::string QuoteXid(std::string_view xid) const override;

  std::string              StartSql(std::string_view xid) const override;
  std::string              EndSql(std::string_view xid) const override;
  std::string              PrepareSql(std::string_view xid) const override;
  std::string              CommitSql(std::string_view xid) const override;
  std::string              CommitOnePhaseSql(std::string_view xid) const override;
  std::vector<std::string> RollbackSql(std::string_view xid, XaState state) const override;

  bool AllowsRollbackBeforePrepare() const override {
    return true;
  }

  std::string RecoverSql() const override {
    return "XA RECOVER";
  }
};

// PostgreSQL PREPARE TRANSACTION. The branch is an ordinary transaction
// until PREPARE TRANSACTION detaches it from the session under the gid.
class PostgresXaDialect final : public XaDialect {
 public:
  std::string_view Name() const override {
    return "postgres";
  }

  std::string QuoteXid(std::string_view xid) const override;

  std::string              StartSql(std::string_view xid) const override;
  std::string              EndSql(std::string_view xid) const override;
  std::string              PrepareSql(std::string_view xid) const override;
  std::string              CommitSql(std::string_view xid) const override;
  std::string              CommitOnePhaseSql(std::string_view xid) const override;
  std::vector<std::string> RollbackSql(std::string_view xid, XaState state) const override;

  bool AllowsRollbackBeforePrepare() const override {
    return true;
  }

  std::string RecoverSql() const override;
};

} // namespace txcoord::xa
