#pragma once

#include <atomic>
#include <cstdint>

namespace syncq::queue {

struct QueueStatsSnapshot {
  std::uint64_t enqueued                = 0;
  std::uint64_t deduplicated            = 0;
  std::uint64_t capacity_rejections     = 0;
  std::uint64_t overflow_evictions      = 0;
  std::uint64_t reserved                = 0;
  std::uint64_t committed               = 0;
  std::uint64_t retried                 = 0;
  std::uint64_t throttled               = 0;
  std::uint64_t dead_lettered           = 0;
  std::uint64_t reaped                  = 0;
  std::uint64_t compression_bytes_saved = 0;
  std::uint64_t encrypt_ops             = 0;
  std::uint64_t max_observed_depth      = 0;
};

/*
  In-process counters of one queue. Relaxed atomics; a snapshot is not
  a consistent cut across counters.
*/
struct QueueStats {
  std::atomic<std::uint64_t> enqueued{0};
  std::atomic<std::uint64_t> deduplicated{0};
  std::atomic<std::uint64_t> capacity_rejections{0};
  std::atomic<std::uint64_t> overflow_evictions{0};
  std::atomic<std::uint64_t> reserved{0};
  std::atomic<std::uint64_t> committed{0};
  std::atomic<std::uint64_t> retried{0};
  std::atomic<std::uint64_t> throttled{0};
  std::atomic<std::uint64_t> dead_lettered{0};
  std::atomic<std::uint64_t> reaped{0};
  std::atomic<std::uint64_t> compression_bytes_saved{0};
  std::atomic<std::uint64_t> encrypt_ops{0};
  std::atomic<std::uint64_t> max_observed_depth{0};

  static void Add(std::atomic<std::uint64_t>& counter, std::uint64_t n = 1) {
    counter.fetch_add(n, std::memory_order_relaxed);
  }

  void ObserveDepth(std::uint64_t depth) {
    auto seen = max_observed_depth.load(std::memory_order_relaxed);
    while (depth > seen && !max_observed_depth.compare_exchange_weak(seen, depth, std::memory_order_relaxed)) {
    }
  }

  QueueStatsSnapshot Snapshot() const {
    QueueStatsSnapshot s;
    s.enqueued                = enqueued.load(std::memory_order_relaxed);
    s.deduplicated            = deduplicated.load(std::memory_order_relaxed);
    s.capacity_rejections     = capacity_rejections.load(std::memory_order_relaxed);
    s.overflow_evictions      = overflow_evictions.load(std::memory_order_relaxed);
    s.reserved                = reserved.load(std::memory_order_relaxed);
    s.committed               = committed.load(std::memory_order_relaxed);
    s.retried                 = retried.load(std::memory_order_relaxed);
    s.throttled               = throttled.load(std::memory_order_relaxed);
    s.dead_lettered           = dead_lettered.load(std::memory_order_relaxed);
    s.reaped                  = reaped.load(std::memory_order_relaxed);
    s.compression_bytes_saved = compression_bytes_saved.load(std::memory_order_relaxed);
    s.encrypt_ops             = encrypt_ops.load(std::memory_order_relaxed);
    s.max_observed_depth      = max_observed_depth.load(std::memory_order_relaxed);
    return s;
  }
};

} // namespace syncq::queue
