#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/result.hpp"

namespace txcoord::db::memory {

/*
  In-process stand-in for an XA resource manager.

  Speaks the MySQL XA statement set (START / END / PREPARE / COMMIT [ONE
  PHASE] / ROLLBACK / RECOVER) with MySQL string-literal rules, and
  accepts every other statement as a no-op so retry managers can run
  against it too. Prepared branches detach from their connection (MySQL
  xa_detach_on_prepare); closing a connection rolls back its unprepared
  branch, as a disconnect does on a real server.

  Engines are the dev backend selected by `memory:` in the config and the
  fixture behind the unit tests, hence the fault-injection surface.
*/
class MemoryXaEngine : public std::enable_shared_from_this<MemoryXaEngine> {
 public:
  enum class BranchState {
    kActive,
    kIdle,
    kPrepared,
  };

  // Runs before a statement executes, outside the engine lock.
  using StatementHook = std::function<void(const std::string& sql)>;

  explicit MemoryXaEngine(std::string server_version = "8.0.36-txcoord-memory");

  MemoryXaEngine(const MemoryXaEngine&)            = delete;
  MemoryXaEngine& operator=(const MemoryXaEngine&) = delete;

  // Throws util::ConnectionError while the engine is unavailable.
  std::unique_ptr<Connection> Connect();

  // One-shot fault for the next statement starting with `statement_prefix`.
  void FailNext(std::string statement_prefix, ErrorCode code, std::string message = "injected fault");
  // Persistent fault until ClearFaults().
  void FailAlways(std::string statement_prefix, ErrorCode code, std::string message = "injected fault");
  void ClearFaults();

  void SetStatementHook(StatementHook hook);
  void SetAvailable(bool available);

  // Registers a branch left PREPARED by a coordinator that no longer exists.
  void InjectPrepared(const std::string& xid);

  std::optional<BranchState> StateOf(const std::string& xid) const;
  std::vector<std::string>   PreparedXids() const;
  std::vector<std::string>   Statements() const;
  std::size_t                OpenConnections() const;
  std::uint64_t              CommittedCount() const;

 private:
  friend class MemoryConnection;

  struct Branch {
    BranchState   state = BranchState::kActive;
    std::uint64_t owner = 0; // 0 once detached by PREPARE
  };

  struct Fault {
    std::string prefix;
    ErrorCode   code;
    std::string message;
    bool        one_shot;
  };

  bool           IsAvailable() const;
  sql::ResultSet Run(std::uint64_t connection_id, const std::string& sql);
  void           Disconnect(std::uint64_t connection_id);

  void              CheckFault(const std::string& sql);
  sql::ResultSet    RunXa(std::uint64_t connection_id, std::string_view rest, const std::string& sql);

  const std::string server_version_;

  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, Branch> branches_;
  std::vector<Fault>                      faults_;
  std::vector<std::string>                statements_;
  StatementHook                           hook_;
  bool                                    available_        = true;
  std::uint64_t                           next_connection_  = 1;
  std::size_t                             open_connections_ = 0;
  std::uint64_t                           committed_        = 0;
};

// Decodes a complete MySQL single-quoted literal (quotes included):
// '' and \' yield a quote, \\ a backslash, \0 NUL, \n \r \t \b \Z their
// control bytes; any other \c yields c. Throws util::ProtocolError when the
// literal is unterminated. `consumed` receives the literal's length.
std::string UnquoteMySqlLiteral(std::string_view text, std::size_t* consumed = nullptr);

} // namespace txcoord::db::memory
