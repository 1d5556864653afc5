#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/message.h>

#include "internal/db/pool/connection_pool.hpp"

namespace txcoord::db {

/*
  DriverRegistry

  Maps a backend kind ("memory", "mysql", "postgres", "cockroach",
  "sqlite") to a function that turns its config message into a connection
  factory. Only drivers compiled into this build are registered; asking
  for any other kind throws util::Unsupported naming the kind.
*/
class DriverRegistry {
 public:
  using Opener = std::function<ConnectionPool::Factory(const google::protobuf::Message& backend)>;

  void Register(std::string kind, Opener opener);

  bool IsRegistered(std::string_view kind) const;

  ConnectionPool::Factory Open(std::string_view kind, const google::protobuf::Message& backend) const;

  std::vector<std::string> Kinds() const;

 private:
  std::map<std::string, Opener, std::less<>> openers_;
};

} // namespace txcoord::db
