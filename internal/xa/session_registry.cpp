#include "session_registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::xa {

using observability::BytesField;
using observability::StringField;

SessionRegistry::SessionRegistry(std::shared_ptr<TwoPhaseParticipant> participant) : participant_(std::move(participant)) {
  if (!participant_) {
    throw std::invalid_argument("session registry needs a participant");
  }
}

XaSession SessionRegistry::Take(const std::string& xid, std::optional<XaState> required) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(xid);
  if (it == sessions_.end()) {
    throw util::NotFound("no active XA session for xid");
  }
  if (required && it->second.State() != *required) {
    throw util::NotFound("no " + std::string(ToString(*required)) + " XA session for xid (it is " +
                         std::string(ToString(it->second.State())) + ")");
  }
  XaSession session = std::move(it->second);
  sessions_.erase(it);
  return session;
}

void SessionRegistry::Put(XaSession session) {
  const auto key = session.Xid();
  {
    std::lock_guard lock(mutex_);
    if (sessions_.try_emplace(key, std::move(session)).second) {
      return;
    }
  }

  // A BeginByXid for the same xid won the slot while this session was out
  // of the map. Dropping it discards its connection; a prepared branch is
  // left to recovery.
  TXCOORD_LOG_WARN("XA session could not be re-registered; xid was taken while it was in flight",
                   {StringField("participant", participant_->Name()), BytesField("xid", session.Xid()),
                    StringField("state", ToString(session.State()))});
  throw util::ProtocolError("xid was registered again while its XA session was in flight");
}

void SessionRegistry::BeginByXid(const std::string& xid) {
  auto session = participant_->Begin(xid);

  {
    std::lock_guard lock(mutex_);
    if (sessions_.find(xid) == sessions_.end()) {
      sessions_.emplace(xid, std::move(session));
      return;
    }
  }

  TXCOORD_LOG_WARN("Duplicate begin for a registered xid; rolling back the new branch",
                   {StringField("participant", participant_->Name()), BytesField("xid", xid)});
  try {
    participant_->Rollback(std::move(session));
  } catch (const std::exception& e) {
    TXCOORD_LOG_WARN("Rollback of duplicate branch failed",
                     {StringField("participant", participant_->Name()), BytesField("xid", xid), StringField("error", e.what())});
  }
  throw util::ProtocolError("xid already has an active XA session");
}

void SessionRegistry::EndByXid(const std::string& xid) {
  auto session = Take(xid, XaState::kStarted);
  participant_->End(session);
  Put(std::move(session));
}

void SessionRegistry::PrepareByXid(const std::string& xid) {
  auto session = Take(xid, XaState::kEnded);
  participant_->Prepare(session);
  Put(std::move(session));
}

void SessionRegistry::CommitManaged(const std::string& xid) {
  participant_->Commit(Take(xid, XaState::kPrepared));
}

void SessionRegistry::RollbackManaged(const std::string& xid) {
  participant_->Rollback(Take(xid, std::nullopt));
}

bool SessionRegistry::Contains(const std::string& xid) const {
  std::lock_guard lock(mutex_);
  return sessions_.find(xid) != sessions_.end();
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::ActiveXids() const {
  std::vector<std::string> xids;
  {
    std::lock_guard lock(mutex_);
    xids.reserve(sessions_.size());
    for (const auto& [xid, session] : sessions_) {
      xids.push_back(xid);
    }
  }
  std::sort(xids.begin(), xids.end());
  return xids;
}

} // namespace txcoord::xa
