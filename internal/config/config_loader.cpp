#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace carelog::config {

namespace rc = carelog::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
// Defaults / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(rc::RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  // pending reports must outlive the process unless memory is asked for
  if (config.database().backend_case() == rc::DatabaseConfig::BACKEND_NOT_SET) {
#if CARELOG_DB_SQLITE
    config.mutable_database()->mutable_sqlite()->set_path("./carelog-data/carelog.db");
#else
    config.mutable_database()->mutable_memory();
#endif
  }

  auto* disk = config.mutable_storage()->mutable_disk();
  if (disk->root_path().empty()) disk->set_root_path("./carelog-data/pending");
  if (!disk->has_fsync()) disk->set_fsync(true);

  auto* extraction = config.mutable_extraction();
  if (extraction->timeout_ms() == 0) extraction->set_timeout_ms(30000);

  auto* detection = config.mutable_detection();
  if (detection->history_window_days() == 0) detection->set_history_window_days(14);
  if (detection->history_padding_hours() == 0) detection->set_history_padding_hours(24);
  if (detection->sleep_default_window_minutes() == 0) detection->set_sleep_default_window_minutes(60);
  if (detection->instant_window_minutes() == 0) detection->set_instant_window_minutes(15);
}

void ConfigLoader::Validate(const rc::RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (level != "trace" && level != "debug" && level != "info" && level != "warn" && level != "error" &&
      level != "critical" && level != "off") {
    throw std::runtime_error("Invalid configuration: logging.level '" + level + "' is not a log level");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  if (config.detection().history_window_days() > 366) {
    throw std::runtime_error("Invalid configuration: detection.history_window_days must be <= 366");
  }
}

rc::RuntimeConfig ConfigLoader::Defaults() {
  rc::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

rc::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  rc::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration in " + path + ": " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace carelog::config
