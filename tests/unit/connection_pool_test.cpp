#include "internal/db/pool/connection_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using txcoord::db::Connection;
using txcoord::db::ConnectionPool;
using txcoord::db::PoolOptions;

class FakeConnection final : public Connection {
 public:
  explicit FakeConnection(std::atomic<int>& alive) : alive_(alive) {
    ++alive_;
  }
  ~FakeConnection() override {
    --alive_;
  }

  bool IsHealthy() const override {
    return healthy;
  }
  void Execute(const std::string&) override {
  }
  void Execute(const std::string&, const txcoord::db::sql::Params&) override {
  }
  txcoord::db::sql::ResultSet Query(const std::string&, const txcoord::db::sql::Params&) override {
    return {};
  }
  txcoord::db::sql::PlaceholderStyle Placeholders() const override {
    return txcoord::db::sql::PlaceholderStyle::kQuestionMark;
  }

  bool healthy = true;

 private:
  std::atomic<int>& alive_;
};

struct Fixture {
  std::atomic<int>                alive{0};
  std::atomic<int>                created{0};
  std::shared_ptr<ConnectionPool> pool;

  explicit Fixture(std::size_t max_connections = 2, std::chrono::milliseconds timeout = 50ms) {
    PoolOptions options;
    options.max_connections = max_connections;
    options.acquire_timeout = timeout;
    pool = std::make_shared<ConnectionPool>("fake", [this]() {
      ++created;
      return std::make_unique<FakeConnection>(alive);
    }, options);
  }
};

void TestReleasedConnectionIsReused() {
  Fixture f;
  Connection* first = nullptr;
  {
    auto conn = f.pool->Acquire();
    first     = conn.get();
  }
  assert(f.pool->IdleCount() == 1);

  auto again = f.pool->Acquire();
  assert(again.get() == first);
  assert(f.created == 1);
}

void TestPoisonedConnectionIsDiscarded() {
  Fixture f;
  {
    auto conn = f.pool->Acquire();
    conn->Poison();
  }
  assert(f.pool->IdleCount() == 0);
  assert(f.pool->LiveCount() == 0);
  assert(f.alive == 0);

  auto fresh = f.pool->Acquire();
  assert(!fresh->IsPoisoned());
  assert(f.created == 2);
}

void TestUnhealthyConnectionIsDiscarded() {
  Fixture f;
  {
    auto conn = f.pool->Acquire();
    static_cast<FakeConnection&>(*conn).healthy = false;
  }
  assert(f.alive == 0);
}

void TestExhaustionTimesOut() {
  Fixture f(1, 30ms);
  auto    held = f.pool->Acquire();

  const auto start = std::chrono::steady_clock::now();
  bool       threw = false;
  try {
    (void)f.pool->Acquire();
  } catch (const txcoord::util::ConnectionError&) {
    threw = true;
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - start >= 30ms);
}

void TestWaiterGetsReleasedConnection() {
  Fixture f(1, 2000ms);
  auto    held = f.pool->Acquire();

  std::thread releaser([&] {
    std::this_thread::sleep_for(20ms);
    held.reset();
  });

  auto conn = f.pool->Acquire();
  assert(conn);
  releaser.join();
  assert(f.created == 1);
}

void TestFactoryFailureFreesTheSlot() {
  std::atomic<int> attempts{0};
  PoolOptions      options;
  options.max_connections = 1;
  options.acquire_timeout = 20ms;
  auto pool = std::make_shared<ConnectionPool>("failing", [&]() -> std::unique_ptr<Connection> {
    ++attempts;
    throw txcoord::util::ConnectionError("refused");
  }, options);

  for (int i = 0; i < 3; ++i) {
    bool threw = false;
    try {
      (void)pool->Acquire();
    } catch (const txcoord::util::ConnectionError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(attempts == 3 && "a failed connect must not leak its slot");
  assert(pool->LiveCount() == 0);
}

void TestConnectionOutlivingPoolIsClosed() {
  std::atomic<int>            alive{0};
  std::shared_ptr<Connection> conn;
  {
    auto pool = std::make_shared<ConnectionPool>("short-lived", [&]() { return std::make_unique<FakeConnection>(alive); });
    conn      = pool->Acquire();
  }
  assert(alive == 1);
  conn.reset();
  assert(alive == 0);
}

} // namespace

int main() {
  TestReleasedConnectionIsReused();
  TestPoisonedConnectionIsDiscarded();
  TestUnhealthyConnectionIsDiscarded();
  TestExhaustionTimesOut();
  TestWaiterGetsReleasedConnection();
  TestFactoryFailureFreesTheSlot();
  TestConnectionOutlivingPoolIsClosed();

  std::cout << "txcoord_unit_connection_pool: pass\n";
  return 0;
}
