#include "internal/xa/session_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_xa_engine.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "internal/util/errors.hpp"

namespace {

using txcoord::db::ConnectionPool;
using txcoord::db::ErrorCode;
using txcoord::db::memory::MemoryXaEngine;
using txcoord::xa::MySqlXaDialect;
using txcoord::xa::PostgresXaDialect;
using txcoord::xa::SessionRegistry;
using txcoord::xa::TwoPhaseParticipant;

using BranchState = MemoryXaEngine::BranchState;

struct Fixture {
  std::shared_ptr<MemoryXaEngine>  engine = std::make_shared<MemoryXaEngine>();
  std::shared_ptr<SessionRegistry> registry;

  explicit Fixture(std::shared_ptr<const txcoord::xa::XaDialect> dialect = std::make_shared<MySqlXaDialect>()) {
    auto e           = engine;
    auto pool        = std::make_shared<ConnectionPool>("registry", [e]() { return e->Connect(); });
    auto participant = std::make_shared<TwoPhaseParticipant>("mem", pool, std::move(dialect));
    registry         = std::make_shared<SessionRegistry>(participant);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestManagedTwoPhaseLifecycle() {
  Fixture f;
  f.registry->BeginByXid("r1");
  assert(f.registry->Contains("r1"));
  f.registry->EndByXid("r1");
  f.registry->PrepareByXid("r1");
  assert(f.engine->StateOf("r1") == BranchState::kPrepared);
  f.registry->CommitManaged("r1");

  assert(!f.registry->Contains("r1"));
  assert(f.registry->Size() == 0);
  assert(f.engine->CommittedCount() == 1);
}

void TestTerminalOperationRemovesTheEntry() {
  Fixture f;
  f.registry->BeginByXid("r2");
  f.registry->EndByXid("r2");
  f.registry->PrepareByXid("r2");
  f.registry->CommitManaged("r2");

  assert(Throws<txcoord::util::NotFound>([&] { f.registry->EndByXid("r2"); }));
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->CommitManaged("r2"); }));
  assert(f.engine->CommittedCount() == 1);
}

void TestEndByXidTwiceInARow() {
  Fixture f;
  f.registry->BeginByXid("r3");
  f.registry->EndByXid("r3");

  assert(Throws<txcoord::util::NotFound>([&] { f.registry->EndByXid("r3"); }));

  const auto statements = f.engine->Statements();
  assert(statements.size() == 2 && "second end must not reach the backend");
  assert(f.registry->Contains("r3"));

  f.registry->PrepareByXid("r3");
  f.registry->CommitManaged("r3");
  assert(!f.registry->Contains("r3"));
}

void TestCommitBeforePrepareIsNotFound() {
  Fixture f;
  f.registry->BeginByXid("r5");
  f.registry->EndByXid("r5");
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->CommitManaged("r5"); }));
  assert(f.registry->Contains("r5"));

  // Rollback is accepted from any live state.
  f.registry->RollbackManaged("r5");
  assert(!f.engine->StateOf("r5").has_value());
}

void TestUnknownXidIsNotFoundForEveryOperation() {
  Fixture f;
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->EndByXid("nope"); }));
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->PrepareByXid("nope"); }));
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->CommitManaged("nope"); }));
  assert(Throws<txcoord::util::NotFound>([&] { f.registry->RollbackManaged("nope"); }));
}

void TestDuplicateBeginRollsBackTheNewBranch() {
  // PostgreSQL's BEGIN does not know the gid, so the registry is what
  // catches the duplicate.
  Fixture f(std::make_shared<PostgresXaDialect>());
  f.registry->BeginByXid("pg");
  assert(Throws<txcoord::util::ProtocolError>([&] { f.registry->BeginByXid("pg"); }));
  assert(f.registry->Size() == 1);

  const auto statements = f.engine->Statements();
  assert(statements.size() == 3);
  assert(statements[0] == "BEGIN");
  assert(statements[1] == "BEGIN");
  assert(statements[2] == "ROLLBACK");
}

void TestReRegisteredXidRejectsTheInFlightSession() {
  Fixture f(std::make_shared<PostgresXaDialect>());
  f.registry->BeginByXid("pg");
  f.registry->EndByXid("pg");

  f.engine->SetStatementHook([&](const std::string& sql) {
    if (sql != "PREPARE TRANSACTION 'pg'") return;
    // BEGIN cannot see the gid, so a second begin slips in while the first
    // session is out of the map.
    std::async(std::launch::async, [&] { f.registry->BeginByXid("pg"); }).get();
  });

  assert(Throws<txcoord::util::ProtocolError>([&] { f.registry->PrepareByXid("pg"); }));
  f.engine->SetStatementHook({});

  // The newer session keeps the slot.
  assert(f.registry->Size() == 1);
  f.registry->RollbackManaged("pg");
  assert(f.registry->Size() == 0);
}

void TestFailedPrepareDropsTheEntry() {
  Fixture f;
  f.registry->BeginByXid("r4");
  f.registry->EndByXid("r4");

  f.engine->FailNext("XA PREPARE", ErrorCode::ProtocolViolation, "XAER_RMFAIL");
  assert(Throws<txcoord::util::ProtocolError>([&] { f.registry->PrepareByXid("r4"); }));
  assert(!f.registry->Contains("r4"));

  // Its connection was discarded, which rolled the idle branch back.
  assert(!f.engine->StateOf("r4").has_value());
  assert(f.engine->OpenConnections() == 0);
}

void TestLockIsReleasedDuringBackendCalls() {
  Fixture f;
  f.registry->BeginByXid("slow");
  f.registry->BeginByXid("other");

  std::atomic<bool> observed{false};
  f.engine->SetStatementHook([&](const std::string& sql) {
    if (sql != "XA END 'slow'") return;
    // Another thread must be able to use the registry while this
    // statement is in flight.
    auto probe = std::async(std::launch::async, [&] {
      f.registry->EndByXid("other");
      return f.registry->Contains("slow");
    });
    assert(probe.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(!probe.get() && "in-flight xid is out of the map");
    observed = true;
  });

  f.registry->EndByXid("slow");
  f.engine->SetStatementHook({});
  assert(observed);
  assert(f.engine->StateOf("other") == BranchState::kIdle);
  assert(f.registry->Contains("slow"));
}

void TestConcurrentCallOnInFlightXidIsNotFound() {
  Fixture f;
  f.registry->BeginByXid("busy");

  bool saw_not_found = false;
  f.engine->SetStatementHook([&](const std::string& sql) {
    if (sql != "XA END 'busy'") return;
    auto rival = std::async(std::launch::async, [&] {
      try {
        f.registry->EndByXid("busy");
      } catch (const txcoord::util::NotFound&) {
        return true;
      }
      return false;
    });
    saw_not_found = rival.get();
  });

  f.registry->EndByXid("busy");
  f.engine->SetStatementHook({});
  assert(saw_not_found);
}

void TestParallelBranches() {
  Fixture                  f;
  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&, i] {
      const auto xid = "p" + std::to_string(i);
      f.registry->BeginByXid(xid);
      f.registry->EndByXid(xid);
      f.registry->PrepareByXid(xid);
      f.registry->CommitManaged(xid);
    });
  }
  for (auto& worker : workers) worker.join();

  assert(f.registry->Size() == 0);
  assert(f.engine->CommittedCount() == 8);
}

void TestActiveXidsAreSorted() {
  Fixture f;
  f.registry->BeginByXid("b");
  f.registry->BeginByXid("a");
  const auto xids = f.registry->ActiveXids();
  assert(xids.size() == 2 && xids[0] == "a" && xids[1] == "b");
  f.registry->RollbackManaged("a");
  f.registry->RollbackManaged("b");
}

} // namespace

int main() {
  TestManagedTwoPhaseLifecycle();
  TestTerminalOperationRemovesTheEntry();
  TestEndByXidTwiceInARow();
  TestCommitBeforePrepareIsNotFound();
  TestUnknownXidIsNotFoundForEveryOperation();
  TestDuplicateBeginRollsBackTheNewBranch();
  TestReRegisteredXidRejectsTheInFlightSession();
  TestFailedPrepareDropsTheEntry();
  TestLockIsReleasedDuringBackendCalls();
  TestConcurrentCallOnInFlightXidIsNotFound();
  TestParallelBranches();
  TestActiveXidsAreSorted();

  std::cout << "txcoord_unit_session_registry: pass\n";
  return 0;
}
