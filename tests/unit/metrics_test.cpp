#include "internal/observability/metrics.hpp"

#include <cassert>
#include <iostream>

namespace {

using txcoord::observability::Metrics;

void TestInitializeReportsWhetherExportIsCompiledIn() {
  txcoord::observability::OtlpConfig config;
  config.service_name = "txcoord-metrics-test";
  config.endpoint     = "localhost:4317";

  const bool exported = txcoord::observability::InitializeMetrics(config);
#ifdef ENABLE_OTEL
  assert(exported);
#else
  assert(!exported);
#endif

  // Counters bind to whatever provider is installed at first use.
  auto& metrics = Metrics::Instance();
  metrics.RecordXaOperation("orders", "prepare", true);
  metrics.RecordXaOperation("orders", "commit", false);
  metrics.RecordRetryAttempt("ledger", "conflict");
  metrics.RecordRecoverySweep("orders", 2, 0);
  assert(&metrics == &Metrics::Instance());
}

void TestShutdownIsIdempotent() {
  txcoord::observability::ShutdownMetrics();
  txcoord::observability::ShutdownMetrics();

  // Recording after shutdown is harmless.
  Metrics::Instance().RecordRetryAttempt("ledger", "committed");
}

} // namespace

int main() {
  TestInitializeReportsWhetherExportIsCompiledIn();
  TestShutdownIsIdempotent();

  std::cout << "txcoord_unit_metrics: pass\n";
  return 0;
}
