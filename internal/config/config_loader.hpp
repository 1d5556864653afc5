#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"

namespace txcoord::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so the proto schema
  in config/config.proto is the single source of truth for field names.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static txcoord::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml for an in-memory document.
  static txcoord::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Throws std::invalid_argument describing the first problem found.
void ValidateConfig(const txcoord::runtime::config::RuntimeConfig& config);

std::chrono::milliseconds ToMilliseconds(const google::protobuf::Duration& duration);

} // namespace txcoord::config
