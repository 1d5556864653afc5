#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"

#include "internal/db/driver_registry.hpp"
#include "internal/db/memory/memory_xa_engine.hpp"
#include "internal/retry/retrying_transaction_manager.hpp"
#include "internal/xa/session_registry.hpp"
#include "internal/xa/two_phase_participant.hpp"

namespace txcoord::factory {

using MemoryEngines = std::unordered_map<std::string, std::shared_ptr<db::memory::MemoryXaEngine>>;

/*
  Runtime

  Every participant, registry and retry manager named in the config,
  plus the in-process engines behind `memory:` backends.
  Everything here lives as long as the Runtime.
*/
struct Runtime {
  std::shared_ptr<MemoryEngines> memory_engines = std::make_shared<MemoryEngines>();

  std::unordered_map<std::string, std::shared_ptr<xa::TwoPhaseParticipant>>            participants;
  std::unordered_map<std::string, std::shared_ptr<xa::SessionRegistry>>                registries;
  std::unordered_map<std::string, std::shared_ptr<retry::RetryingTransactionManager>> retry_managers;

  std::string stale_prefix;

  // All three throw util::NotFound for an unknown name.
  xa::TwoPhaseParticipant&           Participant(const std::string& name) const;
  xa::SessionRegistry&               Registry(const std::string& name) const;
  retry::RetryingTransactionManager& RetryManager(const std::string& name) const;

  // nullptr when no backend uses that engine.
  std::shared_ptr<db::memory::MemoryXaEngine> MemoryEngine(const std::string& name) const;
};

// Drivers compiled into this build, with memory backends resolving their
// engine through `engines` (created on first use).
db::DriverRegistry DefaultDrivers(std::shared_ptr<MemoryEngines> engines);

/*
  Build

  Validates the config and constructs the runtime. No connection is
  opened here; pools connect lazily on first Acquire().

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete driver types.
*/
Runtime Build(const txcoord::runtime::config::RuntimeConfig& config, retry::RetryingTransactionManager::Sleeper sleeper = {});

} // namespace txcoord::factory
