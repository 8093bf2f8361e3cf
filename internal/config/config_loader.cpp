#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace casetrack::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static casetrack::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  casetrack::runtime::config::RuntimeConfig config;

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

casetrack::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

casetrack::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const casetrack::runtime::config::RuntimeConfig& config) {
  using casetrack::runtime::config::DatabaseConfig;

  const auto& db = config.database();
  if (db.backend_case() == DatabaseConfig::kSqlite && db.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (db.backend_case() == DatabaseConfig::kPostgres && db.postgres().conninfo().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.conninfo is required");
  }

  for (const auto* duration : {&config.idempotency().retention(), &config.idempotency().sweep_interval(), &config.idempotency().pending_lease(),
                               &config.locks().inactivity_timeout(),
                               &config.breakers().default_cooldown(), &config.lifecycle().resume_sweep_interval()}) {
    if (duration->seconds() < 0 || duration->nanos() < 0) {
      throw std::runtime_error("Invalid configuration: durations must not be negative");
    }
  }

  std::set<std::string> names;
  for (const auto& dependency : config.breakers().dependencies()) {
    if (dependency.name().empty()) {
      throw std::runtime_error("Invalid configuration: breakers.dependencies[].name is required");
    }
    if (!names.insert(dependency.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate breaker dependency " + dependency.name());
    }
    if (dependency.cooldown().seconds() < 0 || dependency.cooldown().nanos() < 0) {
      throw std::runtime_error("Invalid configuration: durations must not be negative");
    }
  }
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::seconds(duration.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(duration.nanos()));
  if (ms <= std::chrono::milliseconds::zero()) {
    return fallback;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(ms);
}

} // namespace casetrack::config
