#include "connection_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcoord::db {

using observability::IntField;
using observability::StringField;

ConnectionPool::ConnectionPool(std::string name, Factory factory, PoolOptions options)
    : name_(std::move(name)), factory_(std::move(factory)), options_(options) {
  if (options_.max_connections == 0) options_.max_connections = 1;
}

std::shared_ptr<Connection> ConnectionPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->IsHealthy()) {
        return Wrap(conn.release());
      }
      --live_connections_;
      TXCOORD_LOG_WARN("Discarding unhealthy idle connection", {StringField("pool", name_)});
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = factory_();
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < options_.max_connections;
    });
    if (!ready) {
      TXCOORD_LOG_WARN("Connection pool exhausted",
                       {StringField("pool", name_), IntField("max_connections", static_cast<std::int64_t>(options_.max_connections)),
                        IntField("timeout_ms", options_.acquire_timeout.count())});
      throw util::ConnectionError("connection pool '" + name_ + "' exhausted: no connection available within " +
                                  std::to_string(options_.acquire_timeout.count()) + "ms");
    }
  }
}

std::shared_ptr<Connection> ConnectionPool::Wrap(Connection* conn) {
  std::weak_ptr<ConnectionPool> weak_self = shared_from_this();
  return std::shared_ptr<Connection>(conn, [weak_self](Connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void ConnectionPool::Release(Connection* conn) {
  std::unique_ptr<Connection> owned(conn);
  const bool                  reusable = !owned->IsPoisoned() && owned->IsHealthy();
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
  // A discarded connection closes here, outside the lock.
}

std::size_t ConnectionPool::IdleCount() const {
  std::lock_guard lock(mutex_);
  return idle_.size();
}

std::size_t ConnectionPool::LiveCount() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

} // namespace txcoord::db
