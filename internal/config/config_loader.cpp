#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace creditgate::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings ("42" as a worker id).
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end     = nullptr;
  const double numeric = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*fields)[it.first.Scalar()]);
      }
      break;
    }
  }
}

creditgate::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  creditgate::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  const auto  to_json = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json.ToString());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

creditgate::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

creditgate::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const creditgate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && level != "trace" && level != "debug" && level != "info" && level != "warn" && level != "error" &&
      level != "critical" && level != "off") {
    throw std::runtime_error("Invalid configuration: logging.level '" + level + "' is not a log level");
  }

  const auto& wallet = config.wallet();
  if (wallet.capacity() < 0 || wallet.refill_seconds_per_credit() < 0 || (wallet.has_initial_balance() && wallet.initial_balance() < 0)) {
    throw std::runtime_error("Invalid configuration: wallet values must not be negative");
  }

  const auto& unlock = config.unlock();
  if (unlock.min_cost() < 0 || unlock.max_cost() < 0) {
    throw std::runtime_error("Invalid configuration: unlock costs must not be negative");
  }
  if (unlock.min_cost() > 0 && unlock.max_cost() > 0 && unlock.min_cost() > unlock.max_cost()) {
    throw std::runtime_error("Invalid configuration: unlock.min_cost exceeds unlock.max_cost");
  }
}

} // namespace creditgate::config
