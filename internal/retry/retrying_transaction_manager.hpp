#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/pool/connection_pool.hpp"
#include "internal/retry/retry_dialect.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/retry/transaction_handle.hpp"

namespace txcoord::retry {

/*
  RetryingTransactionManager

  Runs a unit of work as one transaction on a backend that resolves
  conflicts by client-side retry instead of two-phase commit.

  Each attempt: acquire a connection, BEGIN, [priority], work, COMMIT.
  util::RetryableConflict from the work or from COMMIT rolls the attempt
  back and, while the policy allows, runs the whole attempt again after
  the policy's backoff. Any other error rolls back and propagates as-is.
  After max_retries retries the conflict surfaces as util::RetryExhausted.

  Work may run several times. Side effects outside the TransactionHandle
  (remote calls, in-memory state) are not undone between attempts and
  are the caller's responsibility.
*/
class RetryingTransactionManager {
 public:
  using Work    = std::function<void(TransactionHandle&)>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // An empty sleeper means std::this_thread::sleep_for.
  RetryingTransactionManager(std::string name, std::shared_ptr<db::ConnectionPool> pool, std::shared_ptr<const RetryDialect> dialect,
                             RetryPolicy policy = {}, Sleeper sleeper = {});

  void ExecuteWithRetry(const Work& work);

  // util::Unsupported, before any statement, when the dialect has no
  // priorities.
  void ExecuteWithPriority(TransactionPriority priority, const Work& work);

  ClusterInfo GetClusterInfo();

  std::string AsOfSystemTimeSql(std::string_view query, std::string_view interval) const;

  const std::string& Name() const {
    return name_;
  }

  const RetryPolicy& Policy() const {
    return policy_;
  }

  const RetryDialect& Dialect() const {
    return *dialect_;
  }

 private:
  void Execute(std::optional<TransactionPriority> priority, const Work& work);
  void RunAttempt(std::optional<TransactionPriority> priority, const Work& work, std::uint32_t attempt);

  const std::string                         name_;
  const std::shared_ptr<db::ConnectionPool> pool_;
  const std::shared_ptr<const RetryDialect> dialect_;
  const RetryPolicy                         policy_;
  const Sleeper                             sleeper_;
};

} // namespace txcoord::retry
