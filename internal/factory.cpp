#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_xa_engine.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if TXCOORD_HAVE_PQXX
#include "internal/db/postgres/pg_connection.hpp"
#endif
#if TXCOORD_HAVE_MYSQL
#include "internal/db/mysql/mysql_connection.hpp"
#endif

namespace txcoord::factory {

namespace cfg = txcoord::runtime::config;

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kDefaultMaxConnections = 16;
constexpr auto        kDefaultAcquireTimeout = std::chrono::milliseconds(5000);

db::PoolOptions ToPoolOptions(const cfg::PoolConfig& pool) {
  db::PoolOptions options;
  options.max_connections = pool.max_connections() > 0 ? pool.max_connections() : kDefaultMaxConnections;
  options.acquire_timeout = pool.has_acquire_timeout() ? config::ToMilliseconds(pool.acquire_timeout()) : kDefaultAcquireTimeout;
  return options;
}

retry::RetryPolicy ToRetryPolicy(const cfg::RetryConfig& retry) {
  retry::RetryPolicy policy;
  // Presence, not value, decides: 0 retries and a 0s backoff are valid.
  if (retry.has_max_retries()) {
    policy.max_retries = retry.max_retries();
  }
  if (retry.has_base_backoff()) {
    policy.base_backoff = config::ToMilliseconds(retry.base_backoff());
  }
  if (retry.has_max_backoff()) {
    policy.max_backoff = config::ToMilliseconds(retry.max_backoff());
  }
  return policy;
}

std::shared_ptr<db::memory::MemoryXaEngine> EngineFor(MemoryEngines& engines, const std::string& name) {
  auto& engine = engines[name.empty() ? "default" : name];
  if (!engine) {
    engine = std::make_shared<db::memory::MemoryXaEngine>();
  }
  return engine;
}

template <typename Map>
auto& Lookup(const Map& map, const std::string& name, std::string_view what) {
  auto it = map.find(name);
  if (it == map.end()) {
    throw util::NotFound("no " + std::string(what) + " named '" + name + "' in the configuration");
  }
  return *it->second;
}

} // namespace

xa::TwoPhaseParticipant& Runtime::Participant(const std::string& name) const {
  return Lookup(participants, name, "participant");
}

xa::SessionRegistry& Runtime::Registry(const std::string& name) const {
  return Lookup(registries, name, "participant");
}

retry::RetryingTransactionManager& Runtime::RetryManager(const std::string& name) const {
  return Lookup(retry_managers, name, "retry manager");
}

std::shared_ptr<db::memory::MemoryXaEngine> Runtime::MemoryEngine(const std::string& name) const {
  auto it = memory_engines->find(name);
  return it == memory_engines->end() ? nullptr : it->second;
}

db::DriverRegistry DefaultDrivers(std::shared_ptr<MemoryEngines> engines) {
  db::DriverRegistry drivers;

  drivers.Register("memory", [engines](const google::protobuf::Message& backend) -> db::ConnectionPool::Factory {
    const auto& memory = static_cast<const cfg::MemoryBackend&>(backend);
    auto        engine = EngineFor(*engines, memory.engine());
    return [engine]() { return engine->Connect(); };
  });

  drivers.Register("sqlite", [](const google::protobuf::Message& backend) -> db::ConnectionPool::Factory {
    db::sqlite::SqliteOptions options;
    options.path = static_cast<const cfg::SqliteBackend&>(backend).path();
    return [options]() -> std::unique_ptr<db::Connection> { return std::make_unique<db::sqlite::SqliteDB>(options); };
  });

#if TXCOORD_HAVE_PQXX
  auto postgres = [](const google::protobuf::Message& backend) -> db::ConnectionPool::Factory {
    const auto uri = static_cast<const cfg::PostgresBackend&>(backend).connection_uri();
    return [uri]() -> std::unique_ptr<db::Connection> { return std::make_unique<db::postgres::PgConnection>(uri); };
  };
  drivers.Register("postgres", postgres);
  drivers.Register("cockroach", postgres);
#endif

#if TXCOORD_HAVE_MYSQL
  drivers.Register("mysql", [](const google::protobuf::Message& backend) -> db::ConnectionPool::Factory {
    const auto&              mysql = static_cast<const cfg::MySqlBackend&>(backend);
    db::mysql::MySqlOptions options;
    options.host        = mysql.host();
    options.port        = mysql.port() > 0 ? mysql.port() : 3306;
    options.user        = mysql.user();
    options.password    = mysql.password();
    options.database    = mysql.database();
    options.unix_socket = mysql.unix_socket();
    return [options]() -> std::unique_ptr<db::Connection> { return std::make_unique<db::mysql::MySqlConnection>(options); };
  });
#endif

  return drivers;
}

/*
    Build full coordination graph
*/
Runtime Build(const cfg::RuntimeConfig& config, retry::RetryingTransactionManager::Sleeper sleeper) {
  config::ValidateConfig(config);

  Runtime runtime;
  runtime.stale_prefix = config.recovery().stale_prefix();

  const auto drivers = DefaultDrivers(runtime.memory_engines);

  // ------------------------------------------------------------------
  // 2PC participants
  // ------------------------------------------------------------------
  for (const auto& participant : config.participants()) {
    std::shared_ptr<const xa::XaDialect> dialect;
    db::ConnectionPool::Factory          connect;

    switch (participant.backend_case()) {
      case cfg::ParticipantConfig::kMemory:
        dialect = std::make_shared<xa::MySqlXaDialect>();
        connect = drivers.Open("memory", participant.memory());
        break;
      case cfg::ParticipantConfig::kMysql:
        dialect = std::make_shared<xa::MySqlXaDialect>();
        connect = drivers.Open("mysql", participant.mysql());
        break;
      case cfg::ParticipantConfig::kPostgres:
        dialect = std::make_shared<xa::PostgresXaDialect>();
        connect = drivers.Open("postgres", participant.postgres());
        break;
      case cfg::ParticipantConfig::BACKEND_NOT_SET:
        throw std::invalid_argument("participant '" + participant.name() + "' has no backend");
    }

    auto pool = std::make_shared<db::ConnectionPool>("participant/" + participant.name(), std::move(connect),
                                                     ToPoolOptions(participant.pool()));
    auto xa_participant = std::make_shared<xa::TwoPhaseParticipant>(participant.name(), std::move(pool), std::move(dialect));

    runtime.registries.emplace(participant.name(), std::make_shared<xa::SessionRegistry>(xa_participant));
    runtime.participants.emplace(participant.name(), std::move(xa_participant));

    TXCOORD_LOG_INFO("Participant configured",
                     {StringField("name", participant.name()), StringField("dialect", runtime.Participant(participant.name()).Dialect().Name())});
  }

  // ------------------------------------------------------------------
  // Retry managers
  // ------------------------------------------------------------------
  for (const auto& manager : config.retry_managers()) {
    std::shared_ptr<const retry::RetryDialect> dialect;
    db::ConnectionPool::Factory                connect;

    switch (manager.backend_case()) {
      case cfg::RetryManagerConfig::kCockroach:
        dialect = std::make_shared<retry::CockroachDialect>();
        connect = drivers.Open("cockroach", manager.cockroach());
        break;
      case cfg::RetryManagerConfig::kSqlite:
        dialect = std::make_shared<retry::SqliteRetryDialect>();
        connect = drivers.Open("sqlite", manager.sqlite());
        break;
      case cfg::RetryManagerConfig::kMemory:
        dialect = std::make_shared<retry::CockroachDialect>();
        connect = drivers.Open("memory", manager.memory());
        break;
      case cfg::RetryManagerConfig::BACKEND_NOT_SET:
        throw std::invalid_argument("retry manager '" + manager.name() + "' has no backend");
    }

    auto pool   = std::make_shared<db::ConnectionPool>("retry/" + manager.name(), std::move(connect), ToPoolOptions(manager.pool()));
    auto policy = ToRetryPolicy(manager.retry());

    runtime.retry_managers.emplace(
        manager.name(), std::make_shared<retry::RetryingTransactionManager>(manager.name(), std::move(pool), std::move(dialect), policy, sleeper));

    TXCOORD_LOG_INFO("Retry manager configured", {StringField("name", manager.name()), IntField("max_retries", policy.max_retries)});
  }

  return runtime;
}

} // namespace txcoord::factory
