#include "two_phase_participant.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::xa {

using observability::BytesField;
using observability::IntField;
using observability::StringField;

namespace {

void Require(const XaSession& session, XaState expected, std::string_view op) {
  if (!session.IsOpen()) {
    throw util::InvalidState(std::string(op) + ": session already consumed");
  }
  if (session.State() != expected) {
    throw util::InvalidState(std::string(op) + " requires state " + std::string(ToString(expected)) + ", session is " +
                             std::string(ToString(session.State())));
  }
}

} // namespace

TwoPhaseParticipant::TwoPhaseParticipant(std::string name, std::shared_ptr<db::ConnectionPool> pool,
                                         std::shared_ptr<const XaDialect> dialect)
    : name_(std::move(name)), pool_(std::move(pool)), dialect_(std::move(dialect)) {
  if (!pool_ || !dialect_) {
    throw std::invalid_argument("participant '" + name_ + "' needs a pool and a dialect");
  }
}

void TwoPhaseParticipant::Run(db::Connection& conn, const std::string& sql, std::string_view op, const std::string& xid) {
  try {
    conn.Execute(sql);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordXaOperation(name_, op, false);
    TXCOORD_LOG_WARN("XA statement failed",
                     {StringField("participant", name_), StringField("op", op), BytesField("xid", xid), StringField("error", e.what())});
    throw;
  }
  observability::Metrics::Instance().RecordXaOperation(name_, op, true);
}

void TwoPhaseParticipant::RunInSession(XaSession& session, const std::string& sql, std::string_view op) {
  try {
    Run(session.Connection(), sql, op, session.Xid());
  } catch (...) {
    // The branch is in an unknown state after a failed END or PREPARE
    // (PostgreSQL aborts the transaction outright). Close the session so a
    // later commit cannot report work the backend already discarded.
    session.Abandon();
    throw;
  }
}

XaSession TwoPhaseParticipant::Begin(const std::string& xid) {
  // Quote first: an unrepresentable xid must not cost a connection.
  const auto sql  = dialect_->StartSql(xid);
  auto       conn = pool_->Acquire();

  try {
    Run(*conn, sql, "begin", xid);
  } catch (...) {
    // Backend session state is unknown after a failed start.
    conn->Poison();
    throw;
  }

  TXCOORD_LOG_DEBUG("XA branch started", {StringField("participant", name_), BytesField("xid", xid)});
  return XaSession(xid, std::move(conn));
}

void TwoPhaseParticipant::End(XaSession& session) {
  Require(session, XaState::kStarted, "end");

  const auto sql = dialect_->EndSql(session.Xid());
  if (!sql.empty()) {
    RunInSession(session, sql, "end");
  }
  session.state_ = XaState::kEnded;

  TXCOORD_LOG_DEBUG("XA branch ended", {StringField("participant", name_), BytesField("xid", session.Xid())});
}

void TwoPhaseParticipant::Prepare(XaSession& session) {
  Require(session, XaState::kEnded, "prepare");

  RunInSession(session, dialect_->PrepareSql(session.Xid()), "prepare");
  session.state_ = XaState::kPrepared;

  TXCOORD_LOG_DEBUG("XA branch prepared", {StringField("participant", name_), BytesField("xid", session.Xid())});
}

void TwoPhaseParticipant::Commit(XaSession session) {
  Require(session, XaState::kPrepared, "commit");

  Run(session.Connection(), dialect_->CommitSql(session.Xid()), "commit", session.Xid());
  session.Finish(XaState::kCommitted);

  TXCOORD_LOG_DEBUG("XA branch committed", {StringField("participant", name_), BytesField("xid", session.Xid())});
}

void TwoPhaseParticipant::CommitOnePhase(XaSession session) {
  Require(session, XaState::kEnded, "commit_one_phase");

  Run(session.Connection(), dialect_->CommitOnePhaseSql(session.Xid()), "commit_one_phase", session.Xid());
  session.Finish(XaState::kCommitted);

  TXCOORD_LOG_DEBUG("XA branch committed in one phase", {StringField("participant", name_), BytesField("xid", session.Xid())});
}

void TwoPhaseParticipant::Rollback(XaSession session) {
  if (!session.IsOpen()) {
    throw util::InvalidState("rollback: session already consumed");
  }

  const auto state = session.State();
  if (state != XaState::kPrepared) {
    const bool early = state == XaState::kStarted || state == XaState::kEnded;
    if (!early || !dialect_->AllowsRollbackBeforePrepare()) {
      throw util::InvalidState("rollback not allowed from state " + std::string(ToString(state)) + " on " +
                               std::string(dialect_->Name()));
    }
  }

  for (const auto& sql : dialect_->RollbackSql(session.Xid(), state)) {
    Run(session.Connection(), sql, "rollback", session.Xid());
  }
  session.Finish(XaState::kRolledBack);

  TXCOORD_LOG_DEBUG("XA branch rolled back",
                    {StringField("participant", name_), BytesField("xid", session.Xid()), StringField("from", ToString(state))});
}

void TwoPhaseParticipant::CommitByXid(const std::string& xid) {
  const auto sql  = dialect_->CommitSql(xid);
  auto       conn = pool_->Acquire();
  Run(*conn, sql, "commit_by_xid", xid);

  TXCOORD_LOG_INFO("Recovered XA branch committed", {StringField("participant", name_), BytesField("xid", xid)});
}

void TwoPhaseParticipant::RollbackByXid(const std::string& xid) {
  const auto statements = dialect_->RollbackSql(xid, XaState::kPrepared);
  auto       conn       = pool_->Acquire();
  for (const auto& sql : statements) {
    Run(*conn, sql, "rollback_by_xid", xid);
  }

  TXCOORD_LOG_INFO("Recovered XA branch rolled back", {StringField("participant", name_), BytesField("xid", xid)});
}

std::vector<TransactionInfo> TwoPhaseParticipant::ListPreparedTransactions() {
  auto conn = pool_->Acquire();

  db::sql::ResultSet rows;
  try {
    rows = conn->Query(dialect_->RecoverSql());
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordXaOperation(name_, "recover", false);
    TXCOORD_LOG_WARN("Recovery query failed", {StringField("participant", name_), StringField("error", e.what())});
    throw;
  }
  observability::Metrics::Instance().RecordXaOperation(name_, "recover", true);

  std::vector<TransactionInfo> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(dialect_->ParseRecovered(row));
  }

  TXCOORD_LOG_DEBUG("Recovery scan", {StringField("participant", name_), IntField("prepared", static_cast<std::int64_t>(out.size()))});
  return out;
}

std::optional<TransactionInfo> TwoPhaseParticipant::FindPreparedTransaction(const std::string& xid) {
  for (auto& info : ListPreparedTransactions()) {
    if (info.xid == xid) {
      return std::move(info);
    }
  }
  return std::nullopt;
}

std::size_t TwoPhaseParticipant::CleanupStaleTransactions(std::string_view prefix) {
  std::size_t rolled_back = 0;
  std::size_t failed      = 0;

  for (const auto& info : ListPreparedTransactions()) {
    if (info.xid.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }

    try {
      RollbackByXid(info.xid);
      ++rolled_back;
    } catch (const std::exception& e) {
      ++failed;
      TXCOORD_LOG_WARN("Skipping stale XA branch that failed to roll back",
                       {StringField("participant", name_), BytesField("xid", info.xid), StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().RecordRecoverySweep(name_, rolled_back, failed);
  TXCOORD_LOG_INFO("Stale XA sweep finished",
                   {StringField("participant", name_), BytesField("prefix", prefix), IntField("rolled_back", static_cast<std::int64_t>(rolled_back)),
                    IntField("failed", static_cast<std::int64_t>(failed))});
  return rolled_back;
}

} // namespace txcoord::xa
