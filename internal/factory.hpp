#pragma once

#include <cstdint>
#include <memory>

#include "config/config.pb.h"
#include "internal/clock/clock.hpp"
#include "internal/codec/key_source.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/db/api/item_store.hpp"
#include "internal/queue/sync_queue.hpp"
#include "internal/retry/retry_engine.hpp"
#include "internal/worker/forwarder.hpp"
#include "internal/worker/outbox_worker.hpp"

namespace syncq::factory {

/*
  Component options derived from RuntimeConfig. Zero-valued fields take
  the defaults of the component option structs.
*/
struct RuntimeOptions {
  codec::CodecOptions   codec;
  queue::QueueOptions   queue;
  retry::RetryPolicy    retry;
  retry::BudgetPolicy   budget;
  retry::BreakerPolicy  breaker;
  worker::WorkerOptions worker;
  std::uint64_t         jitter_seed = 0;

  static RuntimeOptions FromConfig(const syncq::runtime::config::RuntimeConfig& config);
};

/*
  Runtime

  Everything one queue needs. Members are declared in dependency order so
  the worker is torn down before the queue it drains.
*/
struct Runtime {
  std::shared_ptr<clock::Clock>         clock;
  std::shared_ptr<codec::KeySource>     keys;
  std::shared_ptr<db::ItemStore>        store;
  std::shared_ptr<codec::PayloadCodec>  codec;
  std::shared_ptr<queue::SyncQueue>     queue;
  std::shared_ptr<retry::RetryEngine>   engine;
  std::shared_ptr<worker::OutboxWorker> worker; // null without a forwarder
};

/*
  Opens the configured store: SQLite (pool + schema bootstrap) when
  store.path is set, the in-memory store otherwise. Throws
  util::StoreFatal when the database cannot be opened or migrated.
*/
std::shared_ptr<db::ItemStore> BuildStore(const syncq::runtime::config::StoreConfig& config, const std::shared_ptr<clock::Clock>& clock);

/*
  BuildRuntime

  Composition root. The only place that knows concrete store and clock
  types.

  - clock: SystemClock when null
  - keys: loaded from codec.keyring_path when null
  - forwarder: no worker is built when null (admin tooling)
*/
Runtime BuildRuntime(const syncq::runtime::config::RuntimeConfig& config, std::shared_ptr<codec::KeySource> keys,
                     std::shared_ptr<worker::Forwarder> forwarder, std::shared_ptr<clock::Clock> clock = nullptr);

} // namespace syncq::factory
