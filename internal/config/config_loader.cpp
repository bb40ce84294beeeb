#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace imc::config {

namespace {

constexpr uint32_t kDefaultWorkers                  = 5;
constexpr uint32_t kDefaultMaxRetries               = 3;
constexpr uint64_t kDefaultResyncPeriodMs           = 30000;
constexpr uint64_t kDefaultWatchReconnectIntervalMs = 1000;
constexpr uint64_t kDefaultUpdateRetryIntervalMs    = 1000;
constexpr uint32_t kDefaultManagerPort              = 8500;
constexpr uint64_t kDefaultQueueBaseDelayMs         = 5;
constexpr uint64_t kDefaultQueueMaxDelayMs          = 1000 * 1000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

imc::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  imc::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(imc::runtime::config::RuntimeConfig* config) {
  auto* controller = config->mutable_controller();

  if (const char* controller_id = std::getenv("IMC_CONTROLLER_ID")) {
    controller->set_controller_id(controller_id);
  }
  if (controller->controller_id().empty()) {
    throw std::runtime_error("Invalid configuration: controller.controller_id is required");
  }

  if (controller->namespace_().empty()) controller->set_namespace_("imc-system");
  if (controller->workers() == 0) controller->set_workers(kDefaultWorkers);
  if (controller->max_retries() == 0) controller->set_max_retries(kDefaultMaxRetries);
  if (controller->resync_period_ms() == 0) controller->set_resync_period_ms(kDefaultResyncPeriodMs);
  if (controller->watch_reconnect_interval_ms() == 0) controller->set_watch_reconnect_interval_ms(kDefaultWatchReconnectIntervalMs);
  if (controller->update_retry_interval_ms() == 0) controller->set_update_retry_interval_ms(kDefaultUpdateRetryIntervalMs);
  if (controller->manager_port() == 0) controller->set_manager_port(kDefaultManagerPort);

  auto* queue = config->mutable_queue();
  if (queue->base_delay_ms() == 0) queue->set_base_delay_ms(kDefaultQueueBaseDelayMs);
  if (queue->max_delay_ms() == 0) queue->set_max_delay_ms(kDefaultQueueMaxDelayMs);
  if (queue->max_delay_ms() < queue->base_delay_ms()) {
    throw std::runtime_error("Invalid configuration: queue.max_delay_ms must not be below queue.base_delay_ms");
  }
}

} // namespace imc::config
