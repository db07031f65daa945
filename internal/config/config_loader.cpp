#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

namespace scanhub::config {

using scanhub::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0042" as a login, a numeric secret)
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

  ConfigLoader::Validate(config);
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

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    throw std::invalid_argument("server.bind_address is required");
  }

  const auto& database = config.database();
  switch (database.backend_case()) {
    case scanhub::runtime::config::DatabaseConfig::kMemory:
      break;
    case scanhub::runtime::config::DatabaseConfig::kSqlite:
      if (database.sqlite().path().empty()) {
        throw std::invalid_argument("database.sqlite.path is required");
      }
      break;
    case scanhub::runtime::config::DatabaseConfig::kPostgres:
      if (database.postgres().connection_uri().empty()) {
        throw std::invalid_argument("database.postgres.connection_uri is required");
      }
      break;
    default:
      throw std::invalid_argument("database backend must be one of memory, sqlite, postgres");
  }

  std::unordered_set<std::string> logins;
  for (const auto& user : config.identity().users()) {
    if (user.login().empty()) {
      throw std::invalid_argument("identity.users entry without login");
    }
    if (!logins.insert(user.login()).second) {
      throw std::invalid_argument("duplicate identity login: " + user.login());
    }
  }

  const auto& sink = config.legacy_sink();
  if (sink.min_latency_ms() > sink.max_latency_ms()) {
    throw std::invalid_argument("legacy_sink.min_latency_ms exceeds max_latency_ms");
  }
  if (sink.failure_probability() < 0.0 || sink.failure_probability() > 1.0) {
    throw std::invalid_argument("legacy_sink.failure_probability must be within [0, 1]");
  }
}

} // namespace scanhub::config
