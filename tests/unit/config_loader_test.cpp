#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "txcoord_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error>
bool Rejects(const std::string& yaml) {
  try {
    auto config = txcoord::config::ConfigLoader::LoadFromYamlString(yaml);
    txcoord::config::ValidateConfig(config);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
participants:
  - name: orders
    pool:
      max_connections: 4
      acquire_timeout: "0.250s"
    mysql:
      host: db.internal
      port: 3307
      user: coordinator
      password: "s3cr\"t"
      database: orders
  - name: ledger
    postgres:
      connection_uri: "postgresql://coordinator@ledger/ledger"
  - name: dev
    memory:
      engine: shared
retry_managers:
  - name: crdb
    retry:
      max_retries: 5
      base_backoff: "0.050s"
      max_backoff: 2s
    cockroach:
      connection_uri: "postgresql://root@crdb:26257/app"
  - name: local
    sqlite:
      path: "/var/lib/txcoord/local.sqlite"
recovery:
  stale_prefix: "job_"
)");

  auto config = txcoord::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  txcoord::config::ValidateConfig(config);

  assert(config.logging().level() == "debug");
  assert(config.participants_size() == 3);

  const auto& orders = config.participants(0);
  assert(orders.has_mysql());
  assert(orders.mysql().port() == 3307);
  assert(orders.mysql().password() == "s3cr\"t");
  assert(orders.pool().max_connections() == 4);
  assert(txcoord::config::ToMilliseconds(orders.pool().acquire_timeout()).count() == 250);

  assert(config.participants(1).has_postgres());
  assert(config.participants(2).memory().engine() == "shared");

  const auto& crdb = config.retry_managers(0);
  assert(crdb.has_cockroach());
  assert(crdb.retry().max_retries() == 5);
  assert(txcoord::config::ToMilliseconds(crdb.retry().base_backoff()).count() == 50);
  assert(txcoord::config::ToMilliseconds(crdb.retry().max_backoff()).count() == 2000);
  assert(config.retry_managers(1).sqlite().path() == "/var/lib/txcoord/local.sqlite");

  assert(config.recovery().stale_prefix() == "job_");
}

void TestQuotedNumericStringStaysString() {
  auto config = txcoord::config::ConfigLoader::LoadFromYamlString(R"(recovery:
  stale_prefix: "007"
)");
  assert(config.recovery().stale_prefix() == "007");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)txcoord::config::ConfigLoader::LoadFromYamlString(R"(participants:
  - name: a
    dialect: mysql
    memory:
      engine: x
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestZeroRetriesIsDistinctFromUnset() {
  const auto config = txcoord::config::ConfigLoader::LoadFromYamlString(R"(retry_managers:
  - name: once
    memory:
      engine: m
    retry:
      max_retries: 0
  - name: plain
    memory:
      engine: m
)");

  assert(config.retry_managers(0).retry().has_max_retries());
  assert(config.retry_managers(0).retry().max_retries() == 0);
  assert(!config.retry_managers(1).retry().has_max_retries());
}

void TestValidationRejectsBadConfigs() {
  assert(Rejects<std::invalid_argument>(R"(participants:
  - memory:
      engine: x
)"));

  assert(Rejects<std::invalid_argument>(R"(participants:
  - name: a
    memory:
      engine: x
  - name: a
    memory:
      engine: y
)"));

  assert(Rejects<std::invalid_argument>(R"(participants:
  - name: a
)"));

  assert(Rejects<std::invalid_argument>(R"(participants:
  - name: a
    postgres:
      connection_uri: ""
)"));

  assert(Rejects<std::invalid_argument>(R"(retry_managers:
  - name: r
    retry:
      base_backoff: 2s
      max_backoff: 1s
    sqlite:
      path: /tmp/x.sqlite
)"));

  assert(Rejects<std::invalid_argument>(R"(retry_managers:
  - name: r
    pool:
      acquire_timeout: "-1s"
    sqlite:
      path: /tmp/x.sqlite
)"));
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestQuotedNumericStringStaysString();
  TestUnknownFieldsAreRejected();
  TestZeroRetriesIsDistinctFromUnset();
  TestValidationRejectsBadConfigs();

  std::cout << "txcoord_unit_config_loader: pass\n";
  return 0;
}
