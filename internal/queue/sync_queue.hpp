#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/clock/clock.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/db/api/item_store.hpp"
#include "internal/model/item.hpp"
#include "queue_stats.hpp"

namespace syncq::queue {

enum class OverflowPolicy : std::uint8_t {
  kReject,
  kDropOldestLowPriority,
  kBlock,
};

std::string_view ToString(OverflowPolicy policy);

struct RetentionPolicy {
  util::Duration committed_horizon{86400000};
  util::Duration dead_horizon{604800000};
  std::size_t    sweep_batch_size = 500;
};

struct QueueOptions {
  // counts every non-Dead item
  std::uint64_t   max_depth       = 10000;
  OverflowPolicy  overflow_policy = OverflowPolicy::kReject;
  util::Duration  block_timeout{0};
  util::Duration  reservation_ttl{300000};
  std::size_t     last_error_max_len = 512;
  RetentionPolicy retention;
};

// Proof of a reservation; commit and fail need it back.
struct ReservationHandle {
  model::ItemId id{};
  std::string   token;
};

struct Reservation {
  ReservationHandle          handle;
  std::string                payload; // plaintext
  model::Priority            priority = model::Priority::kNormal;
  std::uint32_t              attempts = 0; // including this one
  util::TimePoint            enqueued_at{};
  std::optional<std::string> idempotency_key;
};

// What fail() writes. next_status must be Pending or Dead; an absent
// last_error keeps the stored one.
struct Disposition {
  model::ItemStatus          next_status = model::ItemStatus::kPending;
  util::TimePoint            next_attempt_at{};
  std::optional<std::string> last_error;
  // -1 hands back the attempt the reservation counted
  std::int32_t attempts_increment = 0;
  bool         throttled          = false;
};

struct RetentionResult {
  std::size_t committed_purged = 0;
  std::size_t dead_purged      = 0;
};

/*
  SyncQueue

  Durable priority queue over an ItemStore. Payloads are encoded on the
  way in and decoded on the way out; the store only ever sees ciphertext.

  Error model (exceptions from util/errors.hpp):
    - Enqueue: QueueFull, ShuttingDown, Degraded, EncodeError
    - Commit/Fail: StaleReservation (token no longer holds the item),
      IllegalTransition, NotFound
    - any call: StoreTransient (busy, pool timeout) and StoreFatal; a
      fatal store error also puts the queue in Degraded, after which
      Enqueue is refused

  Items whose payload cannot be decoded are moved to Dead with
  last_error "Undecodable(...)" inside Reserve and never returned.
*/
class SyncQueue {
 public:
  SyncQueue(std::shared_ptr<db::ItemStore> store, std::shared_ptr<codec::PayloadCodec> codec, std::shared_ptr<clock::Clock> clock,
            QueueOptions options = {});

  SyncQueue(const SyncQueue&)            = delete;
  SyncQueue& operator=(const SyncQueue&) = delete;

  model::ItemId Enqueue(std::string_view payload, model::Priority priority, std::optional<std::string> idempotency_key = std::nullopt);

  std::vector<Reservation> Reserve(std::size_t limit);

  void Commit(const ReservationHandle& handle);
  void Fail(const ReservationHandle& handle, const Disposition& disposition);

  // InFlight items past their deadline go back to Pending; returns how many
  std::size_t Reap();

  // ---------------------------------------------------------------------
  // Inspection
  // ---------------------------------------------------------------------

  model::ItemStatus Status(const model::ItemId& id);
  model::ItemView   Inspect(const model::ItemId& id);

  // every status is present, zero when empty
  db::StatusCounts DepthByStatus();

  std::map<model::Priority, util::Duration> OldestPendingAge();

  // Dead items, oldest first
  std::vector<model::ItemView> DeadLetters(std::size_t limit);

  QueueStatsSnapshot Stats() const {
    return stats_.Snapshot();
  }

  bool Healthy();

  bool Degraded() const {
    return degraded_.load();
  }

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // removes Committed/Dead items; unknown ids are skipped
  std::size_t Purge(const std::vector<model::ItemId>& ids);

  RetentionResult ApplyRetention();

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  // called after every accepted enqueue
  void SetWakeListener(std::function<void()> listener);

  // called by Shutdown() with the grace period
  void SetDrainHook(std::function<void(util::Duration)> hook);

  // stop accepting enqueues, release blocked producers, drain the worker
  void Shutdown(util::Duration grace);

  bool ShuttingDown() const {
    return shutting_down_.load();
  }

  const QueueOptions& Options() const {
    return options_;
  }

 private:
  // shared with Block timers, which may outlive a call
  struct CapacitySignal {
    std::mutex              mutex;
    std::condition_variable cv;
    std::uint64_t           epoch  = 0;
    bool                    closed = false;
  };

  enum class EnqueueOutcome : std::uint8_t { kInserted, kDeduplicated, kFull };

  void CheckAccepting() const;

  // translate a failed store result into the queue's exceptions
  [[noreturn]] void Raise(const db::Result& result, std::string_view context);

  // run f in a store transaction, translating DbError
  template <typename F>
  auto Transact(std::string_view context, F&& f);

  bool WaitForCapacity(std::uint64_t observed_epoch, util::TimePoint deadline);
  void SignalCapacity();
  std::uint64_t CapacityEpoch();

  void EnterDegraded(const std::string& reason);
  void NotifyWake();

  std::shared_ptr<db::ItemStore>       store_;
  std::shared_ptr<codec::PayloadCodec> codec_;
  std::shared_ptr<clock::Clock>        clock_;
  QueueOptions                         options_;

  std::shared_ptr<CapacitySignal> capacity_;

  std::atomic<bool> degraded_{false};
  std::atomic<bool> shutting_down_{false};

  std::mutex                          hooks_mutex_;
  std::function<void()>               wake_listener_;
  std::function<void(util::Duration)> drain_hook_;

  QueueStats stats_;
};

} // namespace syncq::queue
