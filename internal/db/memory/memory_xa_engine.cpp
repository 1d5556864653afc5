#include "memory_xa_engine.hpp"

#include <algorithm>
#include <cctype>

#include "internal/db/memory/memory_connection.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::db::memory {

namespace {

std::string_view TrimLeft(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  return text;
}

std::string_view Trim(std::string_view text) {
  text = TrimLeft(text);
  while (!text.empty() && (std::isspace(static_cast<unsigned char>(text.back())) || text.back() == ';')) text.remove_suffix(1);
  return text;
}

// Case-insensitive keyword match at the start of `text`; consumes it.
bool ConsumeKeyword(std::string_view& text, std::string_view keyword) {
  text = TrimLeft(text);
  if (text.size() < keyword.size()) return false;
  for (std::size_t i = 0; i < keyword.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(text[i])) != keyword[i]) return false;
  }
  if (text.size() > keyword.size()) {
    const auto next = static_cast<unsigned char>(text[keyword.size()]);
    if (std::isalnum(next) || next == '_') return false;
  }
  text.remove_prefix(keyword.size());
  return true;
}

bool ContainsIgnoreCase(std::string_view text, std::string_view needle) {
  auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
  });
  return it != text.end();
}

} // namespace

std::string UnquoteMySqlLiteral(std::string_view text, std::size_t* consumed) {
  if (text.empty() || text.front() != '\'') {
    throw util::ProtocolError("syntax error: expected a quoted literal");
  }

  std::string value;
  for (std::size_t i = 1; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\\') {
      if (i + 1 >= text.size()) break;
      const char escaped = text[++i];
      switch (escaped) {
        case '0':
          value.push_back('\0');
          break;
        case 'n':
          value.push_back('\n');
          break;
        case 'r':
          value.push_back('\r');
          break;
        case 't':
          value.push_back('\t');
          break;
        case 'b':
          value.push_back('\b');
          break;
        case 'Z':
          value.push_back('\x1a');
          break;
        default:
          value.push_back(escaped);
          break;
      }
      continue;
    }
    if (c == '\'') {
      if (i + 1 < text.size() && text[i + 1] == '\'') {
        value.push_back('\'');
        ++i;
        continue;
      }
      if (consumed) *consumed = i + 1;
      return value;
    }
    value.push_back(c);
  }
  throw util::ProtocolError("syntax error: unterminated quoted literal");
}

MemoryXaEngine::MemoryXaEngine(std::string server_version) : server_version_(std::move(server_version)) {
}

std::unique_ptr<Connection> MemoryXaEngine::Connect() {
  std::uint64_t id = 0;
  {
    std::lock_guard lock(mutex_);
    if (!available_) {
      throw util::ConnectionError("memory engine unavailable");
    }
    id = next_connection_++;
    ++open_connections_;
  }
  return std::make_unique<MemoryConnection>(shared_from_this(), id);
}

void MemoryXaEngine::FailNext(std::string statement_prefix, ErrorCode code, std::string message) {
  std::lock_guard lock(mutex_);
  faults_.push_back({std::move(statement_prefix), code, std::move(message), true});
}

void MemoryXaEngine::FailAlways(std::string statement_prefix, ErrorCode code, std::string message) {
  std::lock_guard lock(mutex_);
  faults_.push_back({std::move(statement_prefix), code, std::move(message), false});
}

void MemoryXaEngine::ClearFaults() {
  std::lock_guard lock(mutex_);
  faults_.clear();
}

void MemoryXaEngine::SetStatementHook(StatementHook hook) {
  std::lock_guard lock(mutex_);
  hook_ = std::move(hook);
}

void MemoryXaEngine::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

bool MemoryXaEngine::IsAvailable() const {
  std::lock_guard lock(mutex_);
  return available_;
}

void MemoryXaEngine::InjectPrepared(const std::string& xid) {
  std::lock_guard lock(mutex_);
  branches_[xid] = Branch{BranchState::kPrepared, 0};
}

std::optional<MemoryXaEngine::BranchState> MemoryXaEngine::StateOf(const std::string& xid) const {
  std::lock_guard lock(mutex_);
  auto            it = branches_.find(xid);
  if (it == branches_.end()) return std::nullopt;
  return it->second.state;
}

std::vector<std::string> MemoryXaEngine::PreparedXids() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> xids;
  for (const auto& [xid, branch] : branches_) {
    if (branch.state == BranchState::kPrepared) xids.push_back(xid);
  }
  std::sort(xids.begin(), xids.end());
  return xids;
}

std::vector<std::string> MemoryXaEngine::Statements() const {
  std::lock_guard lock(mutex_);
  return statements_;
}

std::size_t MemoryXaEngine::OpenConnections() const {
  std::lock_guard lock(mutex_);
  return open_connections_;
}

std::uint64_t MemoryXaEngine::CommittedCount() const {
  std::lock_guard lock(mutex_);
  return committed_;
}

void MemoryXaEngine::Disconnect(std::uint64_t connection_id) {
  std::lock_guard lock(mutex_);
  --open_connections_;
  for (auto it = branches_.begin(); it != branches_.end();) {
    if (it->second.owner == connection_id && it->second.state != BranchState::kPrepared) {
      it = branches_.erase(it);
      continue;
    }
    ++it;
  }
}

void MemoryXaEngine::CheckFault(const std::string& sql) {
  for (auto it = faults_.begin(); it != faults_.end(); ++it) {
    if (sql.rfind(it->prefix, 0) != 0) continue;
    const auto code    = it->code;
    const auto message = it->message + " (" + sql + ")";
    if (it->one_shot) faults_.erase(it);
    Raise(code, message);
  }
}

sql::ResultSet MemoryXaEngine::Run(std::uint64_t connection_id, const std::string& sql) {
  StatementHook hook;
  {
    std::lock_guard lock(mutex_);
    hook = hook_;
  }
  if (hook) hook(sql);

  std::lock_guard lock(mutex_);
  if (!available_) {
    throw util::ConnectionError("memory engine unavailable");
  }
  statements_.push_back(sql);
  CheckFault(sql);

  std::string_view rest = Trim(sql);
  if (ConsumeKeyword(rest, "XA")) {
    return RunXa(connection_id, rest, sql);
  }

  if (ConsumeKeyword(rest, "COMMIT")) {
    ++committed_;
    return {};
  }

  if (ConsumeKeyword(rest, "SELECT") && ContainsIgnoreCase(rest, "version()")) {
    sql::ResultSet rows;
    rows.emplace_back(std::vector<std::optional<std::string>>{server_version_});
    return rows;
  }

  return {};
}

sql::ResultSet MemoryXaEngine::RunXa(std::uint64_t connection_id, std::string_view rest, const std::string& sql) {
  if (ConsumeKeyword(rest, "RECOVER")) {
    sql::ResultSet rows;
    for (const auto& [xid, branch] : branches_) {
      if (branch.state != BranchState::kPrepared) continue;
      rows.emplace_back(std::vector<std::optional<std::string>>{"1", std::to_string(xid.size()), "0", xid});
    }
    return rows;
  }

  enum class Verb { kStart, kEnd, kPrepare, kCommit, kRollback };
  Verb verb;
  if (ConsumeKeyword(rest, "START") || ConsumeKeyword(rest, "BEGIN")) {
    verb = Verb::kStart;
  } else if (ConsumeKeyword(rest, "END")) {
    verb = Verb::kEnd;
  } else if (ConsumeKeyword(rest, "PREPARE")) {
    verb = Verb::kPrepare;
  } else if (ConsumeKeyword(rest, "COMMIT")) {
    verb = Verb::kCommit;
  } else if (ConsumeKeyword(rest, "ROLLBACK")) {
    verb = Verb::kRollback;
  } else {
    Raise(ErrorCode::ProtocolViolation, "syntax error near '" + sql + "'");
  }

  rest = TrimLeft(rest);
  std::size_t consumed = 0;
  const auto  xid      = UnquoteMySqlLiteral(rest, &consumed);
  rest.remove_prefix(consumed);

  bool one_phase = false;
  if (verb == Verb::kCommit && ConsumeKeyword(rest, "ONE")) {
    if (!ConsumeKeyword(rest, "PHASE")) {
      Raise(ErrorCode::ProtocolViolation, "syntax error near '" + sql + "'");
    }
    one_phase = true;
  }
  if (!TrimLeft(rest).empty()) {
    Raise(ErrorCode::ProtocolViolation, "syntax error: unexpected '" + std::string(rest) + "' after xid");
  }

  auto it = branches_.find(xid);

  if (verb == Verb::kStart) {
    for (const auto& [other, branch] : branches_) {
      if (branch.owner == connection_id && branch.state != BranchState::kPrepared) {
        Raise(ErrorCode::ProtocolViolation, "XAER_RMFAIL: connection already has an active XA transaction");
      }
    }
    if (it != branches_.end()) {
      Raise(ErrorCode::AlreadyExists, "XAER_DUPID: The XID already exists");
    }
    branches_.emplace(xid, Branch{BranchState::kActive, connection_id});
    return {};
  }

  if (it == branches_.end()) {
    Raise(ErrorCode::NotFound, "XAER_NOTA: Unknown XID");
  }
  auto& branch = it->second;

  // Unprepared branches are only visible to the connection that opened them.
  if (branch.state != BranchState::kPrepared && branch.owner != connection_id) {
    Raise(ErrorCode::NotFound, "XAER_NOTA: Unknown XID");
  }

  switch (verb) {
    case Verb::kEnd:
      if (branch.state != BranchState::kActive) {
        Raise(ErrorCode::ProtocolViolation, "XAER_RMFAIL: The command cannot be executed when global transaction is in the IDLE/PREPARED state");
      }
      branch.state = BranchState::kIdle;
      return {};

    case Verb::kPrepare:
      if (branch.state != BranchState::kIdle) {
        Raise(ErrorCode::ProtocolViolation, "XAER_RMFAIL: The command cannot be executed when global transaction is in the ACTIVE/PREPARED state");
      }
      branch.state = BranchState::kPrepared;
      branch.owner = 0;
      return {};

    case Verb::kCommit:
      if (one_phase ? branch.state != BranchState::kIdle : branch.state != BranchState::kPrepared) {
        Raise(ErrorCode::ProtocolViolation, "XAER_RMFAIL: The command cannot be executed in the current XA state");
      }
      branches_.erase(it);
      ++committed_;
      return {};

    case Verb::kRollback:
      if (branch.state == BranchState::kActive) {
        Raise(ErrorCode::ProtocolViolation, "XAER_RMFAIL: The command cannot be executed when global transaction is in the ACTIVE state");
      }
      branches_.erase(it);
      return {};

    case Verb::kStart:
      break;
  }
  return {};
}

} // namespace txcoord::db::memory
