#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace tripgraph::config {

using tripgraph::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("5432" as a password)
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
        // `memory: {}` and a bare `memory:` both select the backend
        if (it.second.IsNull()) {
          (*struct_value->mutable_fields())[it.first.Scalar()].mutable_struct_value();
          continue;
        }
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// `format: csv` -> DATASET_FORMAT_CSV, `transport: http` -> OTLP_TRANSPORT_HTTP
static void ExpandEnumShorthand(google::protobuf::Struct& root, const char* section, const char* field, const std::string& prefix) {
  auto section_it = root.mutable_fields()->find(section);
  if (section_it == root.mutable_fields()->end() || !section_it->second.has_struct_value()) {
    return;
  }
  auto& fields   = *section_it->second.mutable_struct_value()->mutable_fields();
  auto  field_it = fields.find(field);
  if (field_it == fields.end() || field_it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return;
  }

  std::string name = field_it->second.string_value();
  for (auto& c : name) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (name.rfind(prefix, 0) != 0) {
    name = prefix + name;
  }
  field_it->second.set_string_value(name);
}

static void ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }
  if (config.database().backend_case() == tripgraph::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->workers() == 0) {
    ingest->set_workers(1);
  }
  if (ingest->max_attempts() == 0) {
    ingest->set_max_attempts(3);
  }
  if (ingest->queue_capacity() == 0) {
    ingest->set_queue_capacity(64);
  }

  if (config.database().has_postgres()) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    if (const char* password = std::getenv("TRIPGRAPH_DB_PASSWORD")) {
      postgres->set_password(password);
    }
    if (postgres->port() == 0) {
      postgres->set_port(5432);
    }
    if (postgres->max_connections() == 0) {
      postgres->set_max_connections(8);
    }
  }
}

static void Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres()) {
    const auto& postgres = config.database().postgres();
    if (postgres.connection_uri().empty() && postgres.host().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres needs connection_uri or host");
    }
  }
  if (config.ingest().queue_capacity() < config.ingest().workers()) {
    throw std::runtime_error("Invalid configuration: ingest.queue_capacity must be >= ingest.workers");
  }
}

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  ExpandEnumShorthand(*json_value.mutable_struct_value(), "dataset", "format", "DATASET_FORMAT_");
  ExpandEnumShorthand(*json_value.mutable_struct_value(), "observability", "transport", "OTLP_TRANSPORT_");

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

  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace tripgraph::config
