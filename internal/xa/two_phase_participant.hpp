#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/pool/connection_pool.hpp"
#include "internal/xa/transaction_info.hpp"
#include "internal/xa/xa_dialect.hpp"
#include "internal/xa/xa_session.hpp"

namespace txcoord::xa {

/*
  TwoPhaseParticipant

  Drives one backend through the two-phase protocol of its XaDialect.

  Every operation either succeeds or throws a definite error; nothing on
  this path is retried. State preconditions are checked before any
  statement is sent and violations throw util::InvalidState.

  Thread-safe: distinct sessions may be driven concurrently. One session
  must not be driven from two threads at once.
*/
class TwoPhaseParticipant {
 public:
  TwoPhaseParticipant(std::string name, std::shared_ptr<db::ConnectionPool> pool, std::shared_ptr<const XaDialect> dialect);

  // Acquires a connection and starts a branch.
  // util::ConnectionError on pool exhaustion; util::ProtocolError when the
  // backend rejects the xid.
  XaSession Begin(const std::string& xid);

  // A backend failure closes the session: its connection is discarded and
  // every later operation on it throws util::InvalidState.
  void End(XaSession& session);
  void Prepare(XaSession& session);

  void Commit(XaSession session);
  void CommitOnePhase(XaSession session);
  void Rollback(XaSession session);

  // Recovery path on a fresh connection; no live session needed.
  // util::NotFound when the backend has no such prepared branch.
  void CommitByXid(const std::string& xid);
  void RollbackByXid(const std::string& xid);

  std::vector<TransactionInfo>   ListPreparedTransactions();
  std::optional<TransactionInfo> FindPreparedTransaction(const std::string& xid);

  // Rolls back every prepared branch whose xid starts with `prefix`.
  // Individual failures are logged and skipped; returns the number of
  // branches actually rolled back.
  std::size_t CleanupStaleTransactions(std::string_view prefix);

  const std::string& Name() const {
    return name_;
  }

  const XaDialect& Dialect() const {
    return *dialect_;
  }

 private:
  void Run(db::Connection& conn, const std::string& sql, std::string_view op, const std::string& xid);
  void RunInSession(XaSession& session, const std::string& sql, std::string_view op);

  std::string                         name_;
  std::shared_ptr<db::ConnectionPool> pool_;
  std::shared_ptr<const XaDialect>    dialect_;
};

} // namespace txcoord::xa
