#include "retrying_transaction_manager.hpp"

#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::retry {

using observability::IntField;
using observability::StringField;

namespace {

void DefaultSleep(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

} // namespace

RetryingTransactionManager::RetryingTransactionManager(std::string name, std::shared_ptr<db::ConnectionPool> pool,
                                                       std::shared_ptr<const RetryDialect> dialect, RetryPolicy policy, Sleeper sleeper)
    : name_(std::move(name)),
      pool_(std::move(pool)),
      dialect_(std::move(dialect)),
      policy_(policy),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(DefaultSleep)) {
  if (!pool_ || !dialect_) {
    throw std::invalid_argument("retry manager '" + name_ + "' needs a pool and a dialect");
  }
  if (policy_.max_backoff < policy_.base_backoff) {
    throw std::invalid_argument("retry manager '" + name_ + "': max_backoff is below base_backoff");
  }
}

void RetryingTransactionManager::ExecuteWithRetry(const Work& work) {
  Execute(std::nullopt, work);
}

void RetryingTransactionManager::ExecuteWithPriority(TransactionPriority priority, const Work& work) {
  if (!dialect_->SupportsPriority()) {
    throw util::Unsupported(std::string(dialect_->Name()) + " does not support transaction priorities");
  }
  Execute(priority, work);
}

void RetryingTransactionManager::Execute(std::optional<TransactionPriority> priority, const Work& work) {
  auto& metrics = observability::Metrics::Instance();

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      RunAttempt(priority, work, attempt);
      metrics.RecordRetryAttempt(name_, "committed");
      if (attempt > 1) {
        TXCOORD_LOG_INFO("Transaction committed after retries", {StringField("manager", name_), IntField("attempts", attempt)});
      }
      return;
    } catch (const util::RetryableConflict& e) {
      if (attempt > policy_.max_retries) {
        metrics.RecordRetryAttempt(name_, "exhausted");
        TXCOORD_LOG_WARN("Retry budget exhausted",
                         {StringField("manager", name_), IntField("attempts", attempt), StringField("error", e.what())});
        throw util::RetryExhausted("transaction still conflicting after " + std::to_string(attempt) + " attempts: " + e.what(),
                                   attempt);
      }

      metrics.RecordRetryAttempt(name_, "conflict");
      const auto delay = policy_.BackoffFor(attempt);
      TXCOORD_LOG_INFO("Retryable conflict; backing off",
                       {StringField("manager", name_), IntField("attempt", attempt), IntField("backoff_ms", delay.count()),
                        StringField("error", e.what())});
      sleeper_(delay);
    } catch (...) {
      metrics.RecordRetryAttempt(name_, "failed");
      throw;
    }
  }
}

void RetryingTransactionManager::RunAttempt(std::optional<TransactionPriority> priority, const Work& work, std::uint32_t attempt) {
  auto conn = pool_->Acquire();
  conn->Execute(dialect_->BeginSql());

  try {
    if (priority) {
      conn->Execute(dialect_->PrioritySql(*priority));
    }

    TransactionHandle handle(*conn, attempt);
    work(handle);

    conn->Execute(dialect_->CommitSql());
  } catch (...) {
    try {
      conn->Execute(dialect_->RollbackSql());
    } catch (const std::exception& e) {
      // The transaction state is unknown; never pool this connection.
      conn->Poison();
      TXCOORD_LOG_WARN("Rollback after failed attempt failed", {StringField("manager", name_), StringField("error", e.what())});
    }
    throw;
  }
}

ClusterInfo RetryingTransactionManager::GetClusterInfo() {
  auto conn = pool_->Acquire();
  return dialect_->ReadClusterInfo(*conn);
}

std::string RetryingTransactionManager::AsOfSystemTimeSql(std::string_view query, std::string_view interval) const {
  return dialect_->AsOfSystemTimeSql(query, interval);
}

} // namespace txcoord::retry
