#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/xa/two_phase_participant.hpp"
#include "internal/xa/xa_session.hpp"

namespace txcoord::xa {

/*
  SessionRegistry

  Xid-keyed front end to one TwoPhaseParticipant, for callers that can
  carry an id across their callback boundaries but not a session.

  Every operation takes the session out of the map, drops the lock, runs
  the backend statement, and (for End/Prepare) puts the session back.
  The lock is never held while a statement runs, so unrelated xids never
  wait on each other's round trips.

  An operation only finds a session in the state it advances from: End
  a Started one, Prepare an Ended one, Commit a Prepared one. Anything
  else, including a second End for the same xid or a call racing an
  operation still in flight, throws util::NotFound and sends nothing;
  calls for one xid are not queued.
  When a backend statement fails, the session is not put back: it is
  destroyed, which discards its connection.
*/
class SessionRegistry {
 public:
  explicit SessionRegistry(std::shared_ptr<TwoPhaseParticipant> participant);

  SessionRegistry(const SessionRegistry&)            = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // util::ProtocolError if `xid` already has an entry; the branch opened
  // for the duplicate is rolled back.
  void BeginByXid(const std::string& xid);

  void EndByXid(const std::string& xid);
  void PrepareByXid(const std::string& xid);
  void CommitManaged(const std::string& xid);
  void RollbackManaged(const std::string& xid);

  bool                     Contains(const std::string& xid) const;
  std::size_t              Size() const;
  std::vector<std::string> ActiveXids() const;

  TwoPhaseParticipant& Participant() {
    return *participant_;
  }

 private:
  // Removes the entry. util::NotFound when absent or not in `required`;
  // a mismatched entry stays registered.
  XaSession Take(const std::string& xid, std::optional<XaState> required);
  // util::ProtocolError if the xid was registered again meanwhile.
  void      Put(XaSession session);

  std::shared_ptr<TwoPhaseParticipant> participant_;

  mutable std::mutex                         mutex_;
  std::unordered_map<std::string, XaSession> sessions_;
};

} // namespace txcoord::xa
