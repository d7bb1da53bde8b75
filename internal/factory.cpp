#include "factory.hpp"

#include <string>

#include "internal/clock/system_clock.hpp"
#include "internal/codec/keyring.hpp"
#include "internal/db/memory/memory_item_store.hpp"
#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_item_store.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace syncq::factory {

namespace cfg = syncq::runtime::config;

namespace {

util::Duration Ms(std::uint64_t value, util::Duration fallback) {
  return value > 0 ? util::Duration(static_cast<std::int64_t>(value)) : fallback;
}

template <typename T, typename V>
T Or(V value, T fallback) {
  return value > 0 ? static_cast<T>(value) : fallback;
}

codec::Algorithm ToAlgorithm(cfg::CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case cfg::COMPRESSION_ALGORITHM_FAST:
      return codec::Algorithm::kFast;
    case cfg::COMPRESSION_ALGORITHM_HIGH:
      return codec::Algorithm::kHigh;
    default:
      return codec::Algorithm::kIdentity;
  }
}

retry::JitterMode ToJitter(cfg::JitterMode mode) {
  switch (mode) {
    case cfg::JITTER_MODE_FULL:
      return retry::JitterMode::kFull;
    case cfg::JITTER_MODE_EQUAL:
      return retry::JitterMode::kEqual;
    case cfg::JITTER_MODE_DECORRELATED:
      return retry::JitterMode::kDecorrelated;
    default:
      return retry::JitterMode::kNone;
  }
}

queue::OverflowPolicy ToOverflow(cfg::OverflowPolicy policy) {
  switch (policy) {
    case cfg::OVERFLOW_POLICY_DROP_OLDEST_LOW_PRIORITY:
      return queue::OverflowPolicy::kDropOldestLowPriority;
    case cfg::OVERFLOW_POLICY_BLOCK:
      return queue::OverflowPolicy::kBlock;
    default:
      return queue::OverflowPolicy::kReject;
  }
}

} // namespace

RuntimeOptions RuntimeOptions::FromConfig(const cfg::RuntimeConfig& config) {
  RuntimeOptions o;

  const auto& codec               = config.codec();
  o.codec.algorithm             = ToAlgorithm(codec.algorithm());
  o.codec.compression_threshold = static_cast<std::size_t>(codec.compression_threshold());
  o.codec.compression_level     = codec.compression_level();

  const auto& queue           = config.queue();
  o.queue.max_depth           = Or(queue.max_depth(), o.queue.max_depth);
  o.queue.overflow_policy     = ToOverflow(queue.overflow_policy());
  o.queue.block_timeout       = Ms(queue.block_timeout_ms(), o.queue.block_timeout);
  o.queue.reservation_ttl     = Ms(queue.reservation_ttl_ms(), o.queue.reservation_ttl);
  o.queue.last_error_max_len  = Or(queue.last_error_max_len(), o.queue.last_error_max_len);

  const auto& retention                = config.retention();
  o.queue.retention.committed_horizon  = Ms(retention.committed_horizon_ms(), o.queue.retention.committed_horizon);
  o.queue.retention.dead_horizon       = Ms(retention.dead_horizon_ms(), o.queue.retention.dead_horizon);
  o.queue.retention.sweep_batch_size   = Or(retention.sweep_batch_size(), o.queue.retention.sweep_batch_size);

  const auto& retry      = config.retry();
  o.retry.base_delay   = Ms(retry.base_delay_ms(), o.retry.base_delay);
  o.retry.max_delay    = Ms(retry.max_delay_ms(), o.retry.max_delay);
  o.retry.max_exponent = Or(retry.max_exponent(), o.retry.max_exponent);
  o.retry.max_attempts = Or(retry.max_attempts(), o.retry.max_attempts);
  o.retry.jitter       = ToJitter(retry.jitter());
  o.retry.auth_floor   = Ms(retry.auth_floor_ms(), o.retry.auth_floor);
  o.jitter_seed        = retry.jitter_seed();

  const auto& budget        = config.retry_budget();
  o.budget.capacity        = Or(budget.capacity(), o.budget.capacity);
  o.budget.refill_interval = Ms(budget.refill_interval_ms(), o.budget.refill_interval);

  const auto& breaker               = config.circuit_breaker();
  o.breaker.failure_threshold     = Or(breaker.failure_threshold(), o.breaker.failure_threshold);
  o.breaker.success_threshold     = Or(breaker.success_threshold(), o.breaker.success_threshold);
  o.breaker.cool_off              = Ms(breaker.cool_off_ms(), o.breaker.cool_off);
  o.breaker.half_open_probe_count = Or(breaker.half_open_probe_count(), o.breaker.half_open_probe_count);
  o.breaker.reset_on_success      = !breaker.disable_reset_on_success();

  const auto& worker             = config.worker();
  o.worker.batch_size           = Or(worker.batch_size(), o.worker.batch_size);
  o.worker.poll_interval        = Ms(worker.poll_interval_ms(), o.worker.poll_interval);
  o.worker.send_timeout         = Ms(worker.send_timeout_ms(), o.worker.send_timeout);
  o.worker.maintenance_interval = Ms(worker.maintenance_interval_ms(), o.worker.maintenance_interval);
  o.worker.join_timeout         = Ms(worker.join_timeout_ms(), o.worker.join_timeout);

  return o;
}

std::shared_ptr<db::ItemStore> BuildStore(const cfg::StoreConfig& config, const std::shared_ptr<clock::Clock>& clock) {
  if (config.path().empty()) {
    SYNCQ_LOG_WARN("no store path configured, items are kept in memory only");
    return std::make_shared<db::memory::MemoryItemStore>();
  }

  db::sqlite::SqliteOptions options;
  options.busy_timeout_ms   = Or(config.busy_timeout_ms(), options.busy_timeout_ms);
  options.synchronous_full  = config.synchronous_full();
  options.sqlcipher_key_hex = config.sqlcipher_key_hex();

  try {
    auto pool = std::make_shared<db::sqlite::SqlitePool>(config.path(), options, Or<std::size_t>(config.pool_size(), 4),
                                                         Ms(config.acquire_timeout_ms(), util::Duration(5000)));
    const int version = db::sqlite::BootstrapSchema(pool->Acquire(), util::ToUnixMillis(clock->Now()));
    SYNCQ_LOG_INFO("sqlite store ready",
                   {observability::StringField("path", config.path()), observability::IntField("schema_version", version)});
    return std::make_shared<db::sqlite::SqliteItemStore>(std::move(pool));
  } catch (const db::DbError& e) {
    throw util::StoreFatal("cannot open store " + config.path() + ": " + e.what());
  }
}

Runtime BuildRuntime(const cfg::RuntimeConfig& config, std::shared_ptr<codec::KeySource> keys, std::shared_ptr<worker::Forwarder> forwarder,
                     std::shared_ptr<clock::Clock> clock) {
  const auto options = RuntimeOptions::FromConfig(config);

  Runtime runtime;
  runtime.clock = clock ? std::move(clock) : std::make_shared<clock::SystemClock>();

  if (!keys) {
    if (config.codec().keyring_path().empty()) {
      throw util::InvalidConfig("codec.keyring_path is required when no key source is supplied");
    }
    keys = codec::Keyring::LoadFromFile(config.codec().keyring_path(), runtime.clock, Ms(config.codec().key_rotation_grace_ms(), util::Duration(604800000)));
  }
  runtime.keys = std::move(keys);

  runtime.store  = BuildStore(config.store(), runtime.clock);
  runtime.codec  = std::make_shared<codec::PayloadCodec>(runtime.keys, options.codec);
  runtime.queue  = std::make_shared<queue::SyncQueue>(runtime.store, runtime.codec, runtime.clock, options.queue);
  runtime.engine = std::make_shared<retry::RetryEngine>(options.retry, options.budget, options.breaker, runtime.clock, options.jitter_seed);

  if (forwarder) {
    runtime.worker = std::make_shared<worker::OutboxWorker>(runtime.queue, runtime.engine, std::move(forwarder), runtime.clock, options.worker);
  }
  return runtime;
}

} // namespace syncq::factory
