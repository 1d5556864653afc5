#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/retry/retry_dialect.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitRuntime  = 2;
constexpr int kExitNotFound = 3;

void Usage() {
  std::cerr << "Usage:\n"
            << "  txcoordctl --config <file> recover list <participant>\n"
            << "  txcoordctl --config <file> recover commit <participant> <xid>\n"
            << "  txcoordctl --config <file> recover rollback <participant> <xid>\n"
            << "  txcoordctl --config <file> recover cleanup <participant> [prefix]\n"
            << "  txcoordctl --config <file> cluster-info <manager>\n"
            << "  txcoordctl --config <file> as-of <manager> <interval> <query>\n";
}

// Xids are arbitrary bytes; print them the way the logs do.
std::string Printable(const std::string& xid) {
  return txcoord::observability::BytesField("xid", xid).value;
}

int RunRecover(const txcoord::factory::Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() < 3) {
    Usage();
    return kExitUsage;
  }

  const auto& sub         = args[1];
  auto&       participant = runtime.Participant(args[2]);

  if (sub == "list") {
    for (const auto& info : participant.ListPreparedTransactions()) {
      std::cout << info.format_id << '\t' << info.gtrid_length << '\t' << info.bqual_length << '\t' << Printable(info.xid) << '\n';
    }
    return kExitOk;
  }

  if (sub == "commit" || sub == "rollback") {
    if (args.size() != 4) {
      Usage();
      return kExitUsage;
    }
    if (sub == "commit") {
      participant.CommitByXid(args[3]);
    } else {
      participant.RollbackByXid(args[3]);
    }
    std::cout << sub << " " << Printable(args[3]) << ": ok\n";
    return kExitOk;
  }

  if (sub == "cleanup") {
    const auto prefix = args.size() >= 4 ? args[3] : runtime.stale_prefix;
    if (prefix.empty()) {
      std::cerr << "cleanup needs a prefix (argument or recovery.stale_prefix)\n";
      return kExitUsage;
    }
    std::cout << "rolled back " << participant.CleanupStaleTransactions(prefix) << " transaction(s)\n";
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

int RunClusterInfo(const txcoord::factory::Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() != 2) {
    Usage();
    return kExitUsage;
  }

  const auto info = runtime.RetryManager(args[1]).GetClusterInfo();
  std::cout << "version: " << info.version << '\n' << "server_version: " << info.server_version << '\n' << "regions:";
  for (const auto& region : info.regions) {
    std::cout << ' ' << region;
  }
  std::cout << '\n';
  return kExitOk;
}

int RunAsOf(const txcoord::factory::Runtime& runtime, const std::vector<std::string>& args) {
  if (args.size() != 4) {
    Usage();
    return kExitUsage;
  }

  std::cout << runtime.RetryManager(args[1]).AsOfSystemTimeSql(args[3], args[2]) << '\n';
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  int rc = kExitUsage;
  try {
    auto config = txcoord::config::ConfigLoader::LoadFromYaml(config_path);
    const bool metrics_exported = txcoord::observability::InitializeMetrics();
    txcoord::observability::InitializeLogging(config);
    TXCOORD_LOG_DEBUG("Metrics export", {txcoord::observability::BoolField("enabled", metrics_exported)});

    auto runtime = txcoord::factory::Build(config);

    if (args[0] == "recover") {
      rc = RunRecover(runtime, args);
    } else if (args[0] == "cluster-info") {
      rc = RunClusterInfo(runtime, args);
    } else if (args[0] == "as-of") {
      rc = RunAsOf(runtime, args);
    } else {
      Usage();
    }
  } catch (const txcoord::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << std::endl;
    rc = kExitNotFound;
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid argument: " << e.what() << std::endl;
    rc = kExitUsage;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    rc = kExitRuntime;
  }

  // Flushes the last metric export before exit.
  txcoord::observability::ShutdownLogging();
  txcoord::observability::ShutdownMetrics();
  return rc;
}
