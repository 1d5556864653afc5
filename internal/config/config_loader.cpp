#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace txcoord::config {

using txcoord::runtime::config::ParticipantConfig;
using txcoord::runtime::config::PoolConfig;
using txcoord::runtime::config::RetryManagerConfig;
using txcoord::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings: "10s" durations and xid prefixes like "007".
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

static bool IsNegative(const google::protobuf::Duration& duration) {
  return duration.seconds() < 0 || duration.nanos() < 0;
}

static void ValidatePool(const std::string& owner, const PoolConfig& pool) {
  if (IsNegative(pool.acquire_timeout())) {
    throw std::invalid_argument(owner + ": pool.acquire_timeout must not be negative");
  }
}

static void ValidateName(const std::string& kind, const std::string& name, std::set<std::string>& seen) {
  if (name.empty()) {
    throw std::invalid_argument(kind + " without a name");
  }
  if (!seen.insert(name).second) {
    throw std::invalid_argument("duplicate " + kind + " name '" + name + "'");
  }
}

void ValidateConfig(const RuntimeConfig& config) {
  std::set<std::string> participant_names;
  for (const auto& participant : config.participants()) {
    ValidateName("participant", participant.name(), participant_names);
    const auto owner = "participant '" + participant.name() + "'";
    if (participant.backend_case() == ParticipantConfig::BACKEND_NOT_SET) {
      throw std::invalid_argument(owner + ": one of memory, mysql, postgres is required");
    }
    if (participant.has_postgres() && participant.postgres().connection_uri().empty()) {
      throw std::invalid_argument(owner + ": postgres.connection_uri is required");
    }
    if (participant.has_mysql() && participant.mysql().host().empty() && participant.mysql().unix_socket().empty()) {
      throw std::invalid_argument(owner + ": mysql.host or mysql.unix_socket is required");
    }
    ValidatePool(owner, participant.pool());
  }

  std::set<std::string> manager_names;
  for (const auto& manager : config.retry_managers()) {
    ValidateName("retry manager", manager.name(), manager_names);
    const auto owner = "retry manager '" + manager.name() + "'";
    if (manager.backend_case() == RetryManagerConfig::BACKEND_NOT_SET) {
      throw std::invalid_argument(owner + ": one of cockroach, sqlite, memory is required");
    }
    if (manager.has_cockroach() && manager.cockroach().connection_uri().empty()) {
      throw std::invalid_argument(owner + ": cockroach.connection_uri is required");
    }
    if (manager.has_sqlite() && manager.sqlite().path().empty()) {
      throw std::invalid_argument(owner + ": sqlite.path is required");
    }
    const auto& retry = manager.retry();
    if (IsNegative(retry.base_backoff()) || IsNegative(retry.max_backoff())) {
      throw std::invalid_argument(owner + ": retry backoff must not be negative");
    }
    if (retry.has_base_backoff() && retry.has_max_backoff() &&
        ToMilliseconds(retry.max_backoff()) < ToMilliseconds(retry.base_backoff())) {
      throw std::invalid_argument(owner + ": retry.max_backoff is shorter than retry.base_backoff");
    }
    ValidatePool(owner, manager.pool());
  }
}

std::chrono::milliseconds ToMilliseconds(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                               std::chrono::nanoseconds(duration.nanos()));
}

} // namespace txcoord::config
