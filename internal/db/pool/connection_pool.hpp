#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace txcoord::db {

struct PoolOptions {
  std::size_t               max_connections = 16;
  std::chrono::milliseconds acquire_timeout{5000};
};

/*
  ConnectionPool

  Shared by every participant / manager configured against one backend.

  Design notes:
  -------------
  - Connections are created lazily through the factory, up to
    max_connections.
  - Acquire() hands out a shared_ptr whose deleter returns the connection;
    callers hold it exclusively until they drop it.
  - Acquire() waits at most acquire_timeout for a free slot, then throws
    util::ConnectionError. There is no other timeout in the library.
  - Poisoned or unhealthy connections are destroyed on release and their
    slot is freed.

  Lifetime:
    Participants own shared_ptr<ConnectionPool>
    Sessions own shared_ptr<Connection>
*/
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
 public:
  using Factory = std::function<std::unique_ptr<Connection>()>;

  ConnectionPool(std::string name, Factory factory, PoolOptions options = {});

  ConnectionPool(const ConnectionPool&)            = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  std::shared_ptr<Connection> Acquire();

  const std::string& Name() const {
    return name_;
  }

  std::size_t IdleCount() const;
  std::size_t LiveCount() const;

 private:
  std::shared_ptr<Connection> Wrap(Connection* conn);
  void                        Release(Connection* conn);

  std::string name_;
  Factory     factory_;
  PoolOptions options_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::vector<std::unique_ptr<Connection>> idle_;
  std::size_t                              live_connections_ = 0;
};

} // namespace txcoord::db
