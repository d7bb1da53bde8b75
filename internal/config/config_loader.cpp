#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "internal/retry/retry_strategy.hpp"
#include "internal/util/errors.hpp"

namespace syncq::config {

using syncq::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // "0123" and 'true' are strings
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
      throw util::InvalidConfig("Unsupported YAML node");
  }
}

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // empty document: all defaults
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidConfig("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string> problems;
  auto                     require = [&](bool ok, const char* message) {
    if (!ok) problems.emplace_back(message);
  };

  const auto& queue = config.queue();
  require(queue.max_depth() > 0, "queue.max_depth must be positive");
  require(queue.overflow_policy() != syncq::runtime::config::OVERFLOW_POLICY_BLOCK || queue.block_timeout_ms() > 0,
          "queue.block_timeout_ms is required with OVERFLOW_POLICY_BLOCK");

  const auto& worker = config.worker();
  require(worker.batch_size() == 0 || queue.max_depth() == 0 || worker.batch_size() <= queue.max_depth(),
          "worker.batch_size must not exceed queue.max_depth");

  const auto& retry = config.retry();
  require(retry.max_attempts() > 0, "retry.max_attempts must be positive");
  require(retry.base_delay_ms() == 0 || retry.max_delay_ms() == 0 || retry.base_delay_ms() <= retry.max_delay_ms(),
          "retry.base_delay_ms must not exceed retry.max_delay_ms");
  // the cap would otherwise swallow the auth backoff
  const syncq::retry::RetryPolicy retry_defaults;
  const std::uint64_t max_delay_ms =
      retry.max_delay_ms() > 0 ? retry.max_delay_ms() : static_cast<std::uint64_t>(retry_defaults.max_delay.count());
  const std::uint64_t auth_floor_ms =
      retry.auth_floor_ms() > 0 ? retry.auth_floor_ms() : static_cast<std::uint64_t>(retry_defaults.auth_floor.count());
  require(auth_floor_ms <= max_delay_ms, "retry.auth_floor_ms must not exceed retry.max_delay_ms");

  const auto& budget = config.retry_budget();
  require(budget.capacity() > 0, "retry_budget.capacity must be positive");
  require(budget.refill_interval_ms() > 0, "retry_budget.refill_interval_ms must be positive");

  const auto& breaker = config.circuit_breaker();
  require(breaker.failure_threshold() > 0, "circuit_breaker.failure_threshold must be positive");
  require(breaker.success_threshold() > 0, "circuit_breaker.success_threshold must be positive");
  require(breaker.half_open_probe_count() > 0, "circuit_breaker.half_open_probe_count must be positive");

  const auto& store = config.store();
  require(!store.path().empty(), "store.path is required");

  const auto& codec = config.codec();
  require(codec.compression_level() >= 0 && codec.compression_level() <= 22, "codec.compression_level must be within [0, 22]");

  const auto& retention = config.retention();
  require(retention.committed_horizon_ms() > 0, "retention.committed_horizon_ms must be set");
  require(retention.dead_horizon_ms() > 0, "retention.dead_horizon_ms must be set");

  if (problems.empty()) {
    return;
  }

  std::ostringstream out;
  out << "Invalid configuration:";
  for (const auto& problem : problems) {
    out << "\n  - " << problem;
  }
  throw util::InvalidConfig(out.str());
}

} // namespace syncq::config
