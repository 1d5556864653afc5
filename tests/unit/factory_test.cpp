#include "internal/factory.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using txcoord::config::ConfigLoader;
using txcoord::factory::Build;
using txcoord::factory::Runtime;

constexpr const char* kTwoShopsYaml = R"(participants:
  - name: orders
    memory:
      engine: shop
    pool:
      max_connections: 2
      acquire_timeout: 1s
  - name: billing
    memory:
      engine: shop
  - name: audit
    memory:
      engine: audit
retry_managers:
  - name: ledger
    memory:
      engine: ledger
    retry:
      max_retries: 2
      base_backoff: 0.010s
      max_backoff: 0.040s
recovery:
  stale_prefix: "job_"
)";

Runtime BuildFrom(const std::string& yaml, std::vector<std::chrono::milliseconds>* sleeps = nullptr) {
  auto config = ConfigLoader::LoadFromYamlString(yaml);
  return Build(config, [sleeps](std::chrono::milliseconds delay) {
    if (sleeps) sleeps->push_back(delay);
  });
}

void TestBuildWiresEveryNamedComponent() {
  auto runtime = BuildFrom(kTwoShopsYaml);

  assert(runtime.participants.size() == 3);
  assert(runtime.registries.size() == 3);
  assert(runtime.retry_managers.size() == 1);
  assert(runtime.stale_prefix == "job_");

  assert(runtime.Participant("orders").Name() == "orders");
  assert(runtime.Participant("orders").Dialect().Name() == "mysql");
  assert(runtime.RetryManager("ledger").Policy().max_retries == 2);
  assert(runtime.RetryManager("ledger").Policy().base_backoff == std::chrono::milliseconds(10));
  assert(runtime.RetryManager("ledger").Policy().max_backoff == std::chrono::milliseconds(40));
}

void TestParticipantsOnOneEngineShareBranches() {
  auto runtime = BuildFrom(kTwoShopsYaml);

  auto& orders = runtime.Registry("orders");
  orders.BeginByXid("tx-1");
  orders.EndByXid("tx-1");
  orders.PrepareByXid("tx-1");
  assert(orders.Contains("tx-1"));

  // billing sees the branch orders prepared; audit does not.
  assert(runtime.Participant("billing").FindPreparedTransaction("tx-1").has_value());
  assert(!runtime.Participant("audit").FindPreparedTransaction("tx-1").has_value());

  orders.CommitManaged("tx-1");
  assert(!orders.Contains("tx-1"));
  assert(!runtime.Participant("billing").FindPreparedTransaction("tx-1").has_value());
  assert(runtime.MemoryEngine("shop")->CommittedCount() == 1);
  assert(runtime.MemoryEngine("shop")->PreparedXids().empty());
  assert(runtime.MemoryEngine("nowhere") == nullptr);
}

void TestRetryManagerUsesInjectedSleeper() {
  std::vector<std::chrono::milliseconds> sleeps;
  auto runtime = BuildFrom(kTwoShopsYaml, &sleeps);

  runtime.MemoryEngine("ledger")->FailNext("UPDATE", txcoord::db::ErrorCode::SerializationFailure, "restart transaction");

  int calls = 0;
  runtime.RetryManager("ledger").ExecuteWithRetry([&](txcoord::retry::TransactionHandle& tx) {
    ++calls;
    tx.Execute("UPDATE accounts SET balance = balance - 1");
  });

  assert(calls == 2);
  assert(sleeps.size() == 1);
  assert(sleeps[0] == std::chrono::milliseconds(10));
}

void TestExplicitZeroRetriesMeansOneAttempt() {
  std::vector<std::chrono::milliseconds> sleeps;
  auto runtime = BuildFrom(R"(retry_managers:
  - name: once
    memory:
      engine: once
    retry:
      max_retries: 0
      base_backoff: 0s
  - name: defaults
    memory:
      engine: defaults
)",
                           &sleeps);

  auto& once = runtime.RetryManager("once");
  assert(once.Policy().max_retries == 0);
  assert(once.Policy().base_backoff == std::chrono::milliseconds(0));

  // Unset fields keep the built-in policy.
  const auto& defaults = runtime.RetryManager("defaults").Policy();
  assert(defaults.max_retries == 3);
  assert(defaults.base_backoff == std::chrono::milliseconds(100));
  assert(defaults.max_backoff == std::chrono::milliseconds(5000));

  runtime.MemoryEngine("once")->FailAlways("UPDATE", txcoord::db::ErrorCode::SerializationFailure, "restart transaction");
  int  calls     = 0;
  bool exhausted = false;
  try {
    once.ExecuteWithRetry([&](txcoord::retry::TransactionHandle& tx) {
      ++calls;
      tx.Execute("UPDATE accounts SET balance = balance - 1");
    });
  } catch (const txcoord::util::RetryExhausted& e) {
    exhausted = e.Attempts() == 1;
  }
  assert(exhausted);
  assert(calls == 1);
  assert(sleeps.empty());
}

void TestUnknownNamesAreNotFound() {
  auto runtime = BuildFrom(kTwoShopsYaml);

  bool threw = false;
  try {
    (void)runtime.Participant("missing");
  } catch (const txcoord::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)runtime.RetryManager("orders");
  } catch (const txcoord::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidConfigIsRejectedBeforeWiring() {
  bool threw = false;
  try {
    (void)BuildFrom(R"(participants:
  - name: orders
    memory:
      engine: a
  - name: orders
    memory:
      engine: b
)");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaultDriversMatchTheBuild() {
  const auto drivers = txcoord::factory::DefaultDrivers(std::make_shared<txcoord::factory::MemoryEngines>());
  const auto kinds   = drivers.Kinds();

  assert(std::find(kinds.begin(), kinds.end(), "memory") != kinds.end());
  assert(std::find(kinds.begin(), kinds.end(), "sqlite") != kinds.end());
#if TXCOORD_HAVE_PQXX
  assert(drivers.IsRegistered("postgres"));
  assert(drivers.IsRegistered("cockroach"));
#else
  assert(!drivers.IsRegistered("postgres"));
#endif

#if !TXCOORD_HAVE_MYSQL
  bool threw = false;
  try {
    (void)BuildFrom(R"(participants:
  - name: legacy
    mysql:
      host: localhost
)");
  } catch (const txcoord::util::Unsupported& e) {
    threw = std::string(e.what()).find("mysql") != std::string::npos;
  }
  assert(threw);
#endif
}

} // namespace

int main() {
  TestBuildWiresEveryNamedComponent();
  TestParticipantsOnOneEngineShareBranches();
  TestRetryManagerUsesInjectedSleeper();
  TestExplicitZeroRetriesMeansOneAttempt();
  TestUnknownNamesAreNotFound();
  TestInvalidConfigIsRejectedBeforeWiring();
  TestDefaultDriversMatchTheBuild();

  std::cout << "txcoord_unit_factory: pass\n";
  return 0;
}
