#include "internal/db/driver_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace txcoord::db {

void DriverRegistry::Register(std::string kind, Opener opener) {
  if (!opener) {
    throw std::invalid_argument("driver '" + kind + "' registered without an opener");
  }
  openers_[std::move(kind)] = std::move(opener);
}

bool DriverRegistry::IsRegistered(std::string_view kind) const {
  return openers_.find(kind) != openers_.end();
}

ConnectionPool::Factory DriverRegistry::Open(std::string_view kind, const google::protobuf::Message& backend) const {
  auto it = openers_.find(kind);
  if (it == openers_.end()) {
    std::string available;
    for (const auto& [name, opener] : openers_) {
      if (!available.empty()) available += ", ";
      available += name;
    }
    throw util::Unsupported("backend '" + std::string(kind) + "' is not compiled into this build (available: " + available + ")");
  }
  return it->second(backend);
}

std::vector<std::string> DriverRegistry::Kinds() const {
  std::vector<std::string> kinds;
  kinds.reserve(openers_.size());
  for (const auto& [name, opener] : openers_) {
    kinds.push_back(name);
  }
  return kinds;
}

} // namespace txcoord::db
