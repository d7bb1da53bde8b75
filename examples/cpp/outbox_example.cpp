#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/clock/system_clock.hpp"
#include "internal/codec/keyring.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/db/memory/memory_item_store.hpp"
#include "internal/queue/sync_queue.hpp"
#include "internal/retry/retry_engine.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/outbox_worker.hpp"

namespace {

// Prints every item and fails the first attempt of "flaky" payloads.
class PrintingForwarder final : public syncq::worker::Forwarder {
 public:
  std::vector<syncq::worker::ForwardResult> SendBatch(const std::vector<syncq::worker::OutboundItem>& items) override {
    std::vector<syncq::worker::ForwardResult> results;
    for (const auto& item : items) {
      std::cout << "deliver " << syncq::util::ToString(item.id) << " [" << syncq::model::ToString(item.priority) << ", attempt "
                << item.attempts << "] " << item.payload << '\n';
      if (item.payload.rfind("flaky", 0) == 0 && item.attempts == 1) {
        results.push_back(syncq::worker::ForwardResult::Retryable("simulated 503"));
      } else {
        results.push_back(syncq::worker::ForwardResult::Ok());
      }
    }
    return results;
  }
};

} // namespace

int main() {
  auto clock = std::make_shared<syncq::clock::SystemClock>();

  // demo key; real deployments load a keyring file
  const auto key  = syncq::codec::Keyring::ParseHexKey("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
  auto       keys = std::make_shared<syncq::codec::Keyring>(key, clock);

  syncq::codec::CodecOptions codec_options;
  codec_options.algorithm             = syncq::codec::Algorithm::kFast;
  codec_options.compression_threshold = 64;

  auto store = std::make_shared<syncq::db::memory::MemoryItemStore>();
  auto codec = std::make_shared<syncq::codec::PayloadCodec>(keys, codec_options);
  auto queue = std::make_shared<syncq::queue::SyncQueue>(store, codec, clock);

  syncq::retry::RetryPolicy retry;
  retry.base_delay = std::chrono::milliseconds(200);
  auto engine      = std::make_shared<syncq::retry::RetryEngine>(retry, syncq::retry::BudgetPolicy{}, syncq::retry::BreakerPolicy{}, clock);

  syncq::worker::WorkerOptions worker_options;
  worker_options.batch_size    = 10;
  worker_options.poll_interval = std::chrono::milliseconds(100);
  syncq::worker::OutboxWorker worker(queue, engine, std::make_shared<PrintingForwarder>(), clock, worker_options);
  worker.Start();

  queue->Enqueue("low priority telemetry", syncq::model::Priority::kLow);
  queue->Enqueue("flaky upload", syncq::model::Priority::kNormal);
  queue->Enqueue("critical alarm", syncq::model::Priority::kCritical, "alarm-42");
  // same key while the first is live: no new item
  queue->Enqueue("critical alarm", syncq::model::Priority::kCritical, "alarm-42");

  std::this_thread::sleep_for(std::chrono::seconds(1));
  queue->Shutdown(std::chrono::seconds(2));

  for (const auto& [status, n] : queue->DepthByStatus()) {
    std::cout << syncq::model::ToString(status) << ": " << n << '\n';
  }
  const auto stats = queue->Stats();
  std::cout << "enqueued " << stats.enqueued << ", deduplicated " << stats.deduplicated << ", retried " << stats.retried << '\n';
  return 0;
}
