#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace txcoord::observability {

struct OtlpConfig {
  std::string service_name{"txcoord"};
  std::string endpoint{};
  bool        insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
void ShutdownMetrics();

/*
  Process-wide counters for coordination outcomes.

  Without ENABLE_OTEL every call compiles to nothing.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // op: begin | end | prepare | commit | commit_one_phase | rollback |
  //     commit_by_xid | rollback_by_xid | recover
  void RecordXaOperation(std::string_view participant, std::string_view op, bool success);

  // outcome: committed | conflict | exhausted | failed
  void RecordRetryAttempt(std::string_view manager, std::string_view outcome);

  void RecordRecoverySweep(std::string_view participant, std::uint64_t rolled_back, std::uint64_t failed);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordXaOperation(std::string_view, std::string_view, bool) {
}

inline void Metrics::RecordRetryAttempt(std::string_view, std::string_view) {
}

inline void Metrics::RecordRecoverySweep(std::string_view, std::uint64_t, std::uint64_t) {
}
#endif

} // namespace txcoord::observability
