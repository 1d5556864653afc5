#pragma once

#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/xa/xa_state.hpp"

namespace txcoord::xa {

class TwoPhaseParticipant;

/*
  XaSession

  One branch: an exclusively owned connection, its xid, and the protocol
  state. Created by TwoPhaseParticipant::Begin, advanced in place by
  End/Prepare, consumed by Commit/CommitOnePhase/Rollback.

  Move-only. A session destroyed before reaching a terminal state poisons
  its connection, so the pool discards it instead of handing a connection
  with an open backend branch to another xid. A prepared branch survives
  that disconnect and is left to the recovery sweep.
*/
class XaSession {
 public:
  XaSession(const XaSession&)            = delete;
  XaSession& operator=(const XaSession&) = delete;

  XaSession(XaSession&& other) noexcept;
  XaSession& operator=(XaSession&& other) noexcept;

  ~XaSession();

  const std::string& Xid() const {
    return xid_;
  }

  XaState State() const {
    return state_;
  }

  // False once consumed or moved from.
  bool IsOpen() const {
    return connection_ != nullptr;
  }

  // For the collaborator's own statements inside the branch.
  // Throws util::InvalidState on a consumed session.
  db::Connection& Connection();

 private:
  friend class TwoPhaseParticipant;

  XaSession(std::string xid, std::shared_ptr<db::Connection> connection);

  void Abandon();

  // Hands the connection back to its pool and marks the terminal state.
  void Finish(XaState terminal);

  std::string                     xid_;
  std::shared_ptr<db::Connection> connection_;
  XaState                         state_ = XaState::kIdle;
};

} // namespace txcoord::xa
