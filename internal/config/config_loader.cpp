#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace opentimeline::config {

namespace {

constexpr unsigned kMaxComposeThreads = 256;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1" is a tag value, not a number)
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

opentimeline::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  opentimeline::runtime::config::RuntimeConfig config;
  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

opentimeline::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

opentimeline::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const opentimeline::runtime::config::RuntimeConfig& config) {
  using opentimeline::runtime::config::DatabaseConfig;

  const auto& db = config.database();
  if (db.backend_case() == DatabaseConfig::kSqlite && db.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must be set");
  }
  if (db.backend_case() == DatabaseConfig::kPostgres && db.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri must be set");
  }

  if (!config.logging().level().empty()) {
    try {
      observability::ParseLogLevel(config.logging().level());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("Invalid configuration: logging.level: " + std::string(e.what()));
    }
  }

  if (config.engine().compose_threads() > kMaxComposeThreads) {
    throw std::runtime_error("Invalid configuration: engine.compose_threads exceeds " + std::to_string(kMaxComposeThreads));
  }

  for (const auto& rule : config.engine().automatic_tags()) {
    if (rule.when().value().empty() || rule.add().value().empty()) {
      throw std::runtime_error("Invalid configuration: engine.automatic_tags entries need when.value and add.value");
    }
  }
}

} // namespace opentimeline::config
