#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace market::config {

namespace {

// Plain scalars may be booleans or numbers; quoted ones are always strings.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void Convert(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;
    case YAML::NodeType::Sequence:
      for (const auto& element : node) {
        Convert(element, out->mutable_list_value()->add_values());
      }
      return;
    case YAML::NodeType::Map:
      for (const auto& entry : node) {
        Convert(entry.second, &(*out->mutable_struct_value()->mutable_fields())[entry.first.as<std::string>()]);
      }
      return;
  }
  throw std::runtime_error("Unsupported YAML node");
}

} // namespace

market::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  // An empty file means "all defaults".
  if (yaml.IsNull()) {
    return Defaults();
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
  }

  google::protobuf::Value json_value;
  Convert(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  market::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

market::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  market::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(market::runtime::config::RuntimeConfig& config) {
  if (config.database().backend_case() == market::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const double ratio = config.observability().trace_sample_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw std::runtime_error("Invalid configuration: observability.trace_sample_ratio must be within [0, 1]");
  }

  auto* bootstrap = config.mutable_bootstrap();
  if (bootstrap->admin().empty()) {
    bootstrap->set_admin(kDefaultBootstrapPrincipal);
  }
  if (bootstrap->fee_destination().empty()) {
    bootstrap->set_fee_destination(kDefaultBootstrapPrincipal);
  }
}

} // namespace market::config
