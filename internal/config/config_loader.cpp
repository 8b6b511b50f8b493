#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "internal/util/errors.hpp"

namespace fmd::config {

using fmd::util::Error;
using fmd::util::ErrorKind;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw Error(ErrorKind::Config, "Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

fmd::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw Error(ErrorKind::Config, "Failed to load YAML config: " + std::string(e.what()), "load_config", path);
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw Error(ErrorKind::Config, "Failed to serialize YAML to JSON: " + std::string(to_json_status.message()), "load_config", path);
  }

  fmd::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw Error(ErrorKind::Config, "Invalid configuration: " + std::string(status.message()), "load_config", path);
  }

  return config;
}

std::string DatabaseBackend(const fmd::runtime::config::RuntimeConfig& config) {
  return config.database().backend().empty() ? "memory" : config.database().backend();
}

uint32_t LockTimeoutMs(const fmd::runtime::config::RuntimeConfig& config) {
  return config.database().lock_timeout_ms() > 0 ? config.database().lock_timeout_ms() : 5000;
}

uint32_t MaxDevicesPerUser(const fmd::runtime::config::RuntimeConfig& config) {
  return config.registry().max_devices_per_user() > 0 ? config.registry().max_devices_per_user() : 1;
}

// default expiry is 5 days
uint64_t PositionExpirySec(const fmd::runtime::config::RuntimeConfig& config) {
  return config.gc().position_expiry_sec() > 0 ? config.gc().position_expiry_sec() : 432000;
}

uint32_t GcIntervalSec(const fmd::runtime::config::RuntimeConfig& config) {
  return config.gc().interval_sec() > 0 ? config.gc().interval_sec() : 300;
}

} // namespace fmd::config
