#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/ledger/validation.hpp"

namespace datamarket::config {

using namespace datamarket::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("42", "true") stay strings
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

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ValidateConfig(const RuntimeConfig& config) {
  const auto& ledger = config.ledger();
  if (ledger.escrow_release() == ESCROW_RELEASE_ON_COMPLETION) {
    if (ledger.treasury_identity().empty()) {
      throw std::invalid_argument("ledger.treasury_identity is required when escrow_release is ESCROW_RELEASE_ON_COMPLETION");
    }
    if (ledger.treasury_identity().size() > datamarket::ledger::kMaxIdentityLength) {
      throw std::invalid_argument("ledger.treasury_identity is too long");
    }
  }

  const auto& database = config.database();
  switch (database.backend_case()) {
    case DatabaseConfig::kSqlite:
      if (database.sqlite().path().empty()) {
        throw std::invalid_argument("database.sqlite.path must not be empty");
      }
      break;
    case DatabaseConfig::kPostgres:
      if (database.postgres().connection_uri().empty()) {
        throw std::invalid_argument("database.postgres.connection_uri must not be empty");
      }
      break;
    case DatabaseConfig::kMemory:
    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }

  const auto& observability = config.observability();
  if ((observability.tracing_enabled() || observability.metrics_enabled()) && observability.service_name().size() > 256) {
    throw std::invalid_argument("observability.service_name is too long");
  }
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

  RuntimeConfig config;

  // empty document: every section at its default
  if (yaml.IsNull()) {
    ValidateConfig(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

  ValidateConfig(config);
  return config;
}

} // namespace datamarket::config
