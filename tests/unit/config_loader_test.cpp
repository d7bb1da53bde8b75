#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using syncq::config::ConfigLoader;
using syncq::util::InvalidConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "syncq_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char* kValidYaml = R"(store:
  path: "/tmp/syncq/queue.db"
  pool_size: 2
codec:
  algorithm: COMPRESSION_ALGORITHM_HIGH
  compression_threshold: 256
  compression_level: 3
queue:
  max_depth: 50
  overflow_policy: OVERFLOW_POLICY_DROP_OLDEST_LOW_PRIORITY
  reservation_ttl_ms: 1000
retry:
  base_delay_ms: 100
  max_delay_ms: 5000
  max_exponent: 6
  max_attempts: 4
  jitter: JITTER_MODE_FULL
  auth_floor_ms: 2000
retry_budget:
  capacity: 3
  refill_interval_ms: 250
circuit_breaker:
  failure_threshold: 2
  success_threshold: 1
  cool_off_ms: 1000
  half_open_probe_count: 1
worker:
  batch_size: 10
retention:
  committed_horizon_ms: 60000
  dead_horizon_ms: 120000
)";

bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::Validate(ConfigLoader::LoadFromString(yaml));
  } catch (const InvalidConfig&) {
    return true;
  }
  return false;
}

void TestLoadsEveryPolicyFromFile() {
  const auto path   = WriteYaml("valid", kValidYaml);
  auto       config = ConfigLoader::LoadFromYaml(path.string());

  assert(config.store().path() == "/tmp/syncq/queue.db");
  assert(config.store().pool_size() == 2);
  assert(config.codec().algorithm() == syncq::runtime::config::COMPRESSION_ALGORITHM_HIGH);
  assert(config.queue().max_depth() == 50);
  assert(config.queue().overflow_policy() == syncq::runtime::config::OVERFLOW_POLICY_DROP_OLDEST_LOW_PRIORITY);
  assert(config.retry().jitter() == syncq::runtime::config::JITTER_MODE_FULL);
  assert(config.retry_budget().refill_interval_ms() == 250);
  assert(config.circuit_breaker().failure_threshold() == 2);
  assert(config.retention().dead_horizon_ms() == 120000);

  ConfigLoader::Validate(config);
}

void TestRuntimeOptionsFollowConfig() {
  auto       config  = ConfigLoader::LoadFromString(kValidYaml);
  const auto options = syncq::factory::RuntimeOptions::FromConfig(config);

  assert(options.codec.algorithm == syncq::codec::Algorithm::kHigh);
  assert(options.codec.compression_threshold == 256);
  assert(options.queue.max_depth == 50);
  assert(options.queue.overflow_policy == syncq::queue::OverflowPolicy::kDropOldestLowPriority);
  assert(options.queue.reservation_ttl.count() == 1000);
  assert(options.retry.base_delay.count() == 100);
  assert(options.retry.max_attempts == 4);
  assert(options.retry.auth_floor.count() == 2000);
  assert(options.retry.jitter == syncq::retry::JitterMode::kFull);
  assert(options.budget.capacity == 3);
  assert(options.breaker.cool_off.count() == 1000);
  assert(options.worker.batch_size == 10);
  // unset fields keep component defaults
  assert(options.worker.poll_interval.count() == 60000);
  assert(options.queue.last_error_max_len == 512);
  assert(options.queue.retention.committed_horizon.count() == 60000);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(store:
  path: "0123"
logging:
  level: "debug"
)");
  assert(config.store().path() == "0123");
  assert(config.logging().level() == "debug");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.queue().max_depth() == 0);
  assert(config.store().path().empty());
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromString("queue:\n  max_depth: 1\n  max_dpeth: 2\n");
  } catch (const InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::LoadFromString("- a\n- b\n");
  } catch (const InvalidConfig&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/syncq.yaml");
  } catch (const InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestValidationCatchesInconsistentSettings() {
  const std::string valid = kValidYaml;
  assert(!Rejects(valid));

  auto replace = [&](const std::string& from, const std::string& to) {
    auto text = valid;
    text.replace(text.find(from), from.size(), to);
    return text;
  };

  assert(Rejects(replace("max_depth: 50", "max_depth: 0")));
  assert(Rejects(replace("batch_size: 10", "batch_size: 51")));
  assert(Rejects(replace("max_attempts: 4", "max_attempts: 0")));
  assert(Rejects(replace("base_delay_ms: 100", "base_delay_ms: 9000")));
  assert(Rejects(replace("auth_floor_ms: 2000", "auth_floor_ms: 6000")));
  // an unset floor takes its 60s default, above this cap
  assert(Rejects(replace("  auth_floor_ms: 2000\n", "")));
  assert(!Rejects(replace("auth_floor_ms: 2000", "auth_floor_ms: 5000")));
  assert(Rejects(replace("capacity: 3", "capacity: 0")));
  assert(Rejects(replace("half_open_probe_count: 1", "half_open_probe_count: 0")));
  assert(Rejects(replace("path: \"/tmp/syncq/queue.db\"", "path: \"\"")));
  assert(Rejects(replace("compression_level: 3", "compression_level: 23")));
  assert(Rejects(replace("committed_horizon_ms: 60000", "committed_horizon_ms: 0")));
  assert(Rejects(replace("OVERFLOW_POLICY_DROP_OLDEST_LOW_PRIORITY", "OVERFLOW_POLICY_BLOCK")));
  assert(!Rejects(replace("OVERFLOW_POLICY_DROP_OLDEST_LOW_PRIORITY", "OVERFLOW_POLICY_BLOCK\n  block_timeout_ms: 500")));
}

} // namespace

int main() {
  TestLoadsEveryPolicyFromFile();
  TestRuntimeOptionsFollowConfig();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentGivesDefaults();
  TestUnknownFieldsAreRejected();
  TestValidationCatchesInconsistentSettings();

  std::cout << "syncq_unit_config_loader: pass\n";
  return 0;
}
