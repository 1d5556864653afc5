#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_xa_engine.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "internal/util/errors.hpp"
#include "internal/xa/two_phase_participant.hpp"

namespace {

using txcoord::db::ConnectionPool;
using txcoord::db::ErrorCode;
using txcoord::db::memory::MemoryXaEngine;
using txcoord::xa::MySqlXaDialect;
using txcoord::xa::TwoPhaseParticipant;

struct Fixture {
  std::shared_ptr<MemoryXaEngine>      engine = std::make_shared<MemoryXaEngine>();
  std::shared_ptr<TwoPhaseParticipant> participant;

  Fixture() {
    auto e      = engine;
    auto pool   = std::make_shared<ConnectionPool>("recovery", [e]() { return e->Connect(); });
    participant = std::make_shared<TwoPhaseParticipant>("mem", pool, std::make_shared<MySqlXaDialect>());
  }
};

void TestListSeesOnlyPreparedBranches() {
  Fixture f;
  f.engine->InjectPrepared("job_1");
  f.engine->InjectPrepared("job_2");

  auto active = f.participant->Begin("active");

  auto prepared = f.participant->Begin("fresh");
  f.participant->End(prepared);
  f.participant->Prepare(prepared);

  auto list = f.participant->ListPreparedTransactions();
  std::sort(list.begin(), list.end(), [](const auto& a, const auto& b) { return a.xid < b.xid; });
  assert(list.size() == 3);
  assert(list[0].xid == "fresh");
  assert(list[1].xid == "job_1");
  assert(list[1].format_id == 1);
  assert(list[1].gtrid_length == 5);
  assert(list[1].bqual_length == 0);
  assert(list[1].data == "job_1");

  f.participant->Rollback(std::move(active));
  f.participant->Commit(std::move(prepared));
}

void TestFindPreparedTransaction() {
  Fixture f;
  f.engine->InjectPrepared("it's here");

  const auto found = f.participant->FindPreparedTransaction("it's here");
  assert(found.has_value());
  assert(found->gtrid_length == 9);
  assert(!f.participant->FindPreparedTransaction("missing").has_value());
}

void TestCleanupRollsBackOnlyPrefixedBranches() {
  Fixture f;
  f.engine->InjectPrepared("job_1");
  f.engine->InjectPrepared("job_2");
  f.engine->InjectPrepared("other");

  assert(f.participant->CleanupStaleTransactions("job_") == 2);

  const auto left = f.engine->PreparedXids();
  assert(left.size() == 1 && left[0] == "other");
}

void TestCleanupSwallowsIndividualFailures() {
  Fixture f;
  f.engine->InjectPrepared("job_1");
  f.engine->InjectPrepared("job_2");
  f.engine->InjectPrepared("other");
  f.engine->FailAlways("XA ROLLBACK 'job_1'", ErrorCode::ProtocolViolation, "XAER_RMERR");

  // The sweep runs to completion; the failed branch is not counted.
  assert(f.participant->CleanupStaleTransactions("job_") == 1);

  const auto left = f.engine->PreparedXids();
  assert(left.size() == 2);
  assert(left[0] == "job_1");
  assert(left[1] == "other");

  f.engine->ClearFaults();
  assert(f.participant->CleanupStaleTransactions("job_") == 1);
}

void TestCleanupSurvivesBranchResolvedConcurrently() {
  Fixture f;
  f.engine->InjectPrepared("job_1");
  f.engine->InjectPrepared("job_2");

  // Someone else resolves job_2 between the scan and the sweep.
  f.engine->SetStatementHook([&](const std::string& sql) {
    if (sql == "XA ROLLBACK 'job_2'") {
      f.engine->SetStatementHook({});
      auto conn = f.engine->Connect();
      conn->Execute("XA COMMIT 'job_2'");
    }
  });

  assert(f.participant->CleanupStaleTransactions("job_") == 1);
  assert(f.engine->PreparedXids().empty());
}

void TestRecoveryPathOnUnknownXid() {
  Fixture f;
  bool    threw = false;
  try {
    f.participant->RollbackByXid("never-prepared");
  } catch (const txcoord::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRecoveryQueryFailurePropagates() {
  Fixture f;
  f.engine->FailNext("XA RECOVER", ErrorCode::ConnectionLost, "server gone");

  bool threw = false;
  try {
    (void)f.participant->CleanupStaleTransactions("job_");
  } catch (const txcoord::util::ConnectionError&) {
    threw = true;
  }
  assert(threw && "only per-branch failures are swallowed");
}

} // namespace

int main() {
  TestListSeesOnlyPreparedBranches();
  TestFindPreparedTransaction();
  TestCleanupRollsBackOnlyPrefixedBranches();
  TestCleanupSwallowsIndividualFailures();
  TestCleanupSurvivesBranchResolvedConcurrently();
  TestRecoveryPathOnUnknownXid();
  TestRecoveryQueryFailurePropagates();

  std::cout << "txcoord_unit_recovery: pass\n";
  return 0;
}
