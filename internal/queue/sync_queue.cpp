#include "sync_queue.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace syncq::queue {

using model::ItemStatus;

namespace {

// a token mismatch on a finished item is a forbidden transition, not a lost race
void RejectTerminal(db::ItemStore& store, db::Transaction& tx, const model::ItemId& id, std::string_view op) {
  auto record = store.Get(tx, id);
  if (record && model::IsTerminal(record->status)) {
    throw util::IllegalTransition(std::string(op) + " " + util::ToString(id) + ": item is " + std::string(model::ToString(record->status)));
  }
}

// "Retryable(connection reset)" -> "Retryable"
std::string_view ReasonLabel(std::string_view reason) {
  return reason.substr(0, reason.find('('));
}

std::int64_t ElapsedMs(util::TimePoint from, util::TimePoint to) {
  return std::chrono::duration_cast<util::Duration>(to - from).count();
}

} // namespace

std::string_view ToString(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::kReject:
      return "Reject";
    case OverflowPolicy::kDropOldestLowPriority:
      return "DropOldestLowPriority";
    case OverflowPolicy::kBlock:
      return "Block";
  }
  return "Unknown";
}

SyncQueue::SyncQueue(std::shared_ptr<db::ItemStore> store, std::shared_ptr<codec::PayloadCodec> codec, std::shared_ptr<clock::Clock> clock,
                     QueueOptions options)
    : store_(std::move(store)), codec_(std::move(codec)), clock_(std::move(clock)), options_(std::move(options)),
      capacity_(std::make_shared<CapacitySignal>()) {
  if (options_.retention.sweep_batch_size == 0) options_.retention.sweep_batch_size = 1;
}

template <typename F>
auto SyncQueue::Transact(std::string_view context, F&& f) {
  try {
    return db::WithTransaction(*store_, std::forward<F>(f));
  } catch (const db::DbError& e) {
    Raise(e.result(), context);
  }
}

void SyncQueue::Raise(const db::Result& result, std::string_view context) {
  std::string message(context);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::StaleReservation(message);
    case db::ErrorCode::Busy:
      throw util::StoreTransient(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::IllegalTransition(message);
    case db::ErrorCode::IOError:
    case db::ErrorCode::Corruption:
      EnterDegraded(message);
      throw util::StoreFatal(message);
    case db::ErrorCode::OK:
    case db::ErrorCode::InternalError:
      break;
  }
  throw util::StoreFatal(message);
}

void SyncQueue::EnterDegraded(const std::string& reason) {
  if (!degraded_.exchange(true)) {
    SYNCQ_LOG_ERROR("fatal store error, queue degraded", {observability::StringField("reason", reason)});
  }
}

void SyncQueue::CheckAccepting() const {
  if (shutting_down_.load()) {
    throw util::ShuttingDown("queue is shutting down");
  }
  if (degraded_.load()) {
    throw util::Degraded("queue is degraded after a fatal store error");
  }
}

// ---------------------------------------------------------------------
// Enqueue
// ---------------------------------------------------------------------

model::ItemId SyncQueue::Enqueue(std::string_view payload, model::Priority priority, std::optional<std::string> idempotency_key) {
  observability::SpanScope span("syncq.enqueue");
  span.SetAttribute("priority", model::ToString(priority));
  CheckAccepting();

  const auto encoded = codec_->Encode(payload);
  QueueStats::Add(stats_.encrypt_ops);
  if (encoded.compressed_size < encoded.plaintext_size) {
    QueueStats::Add(stats_.compression_bytes_saved, encoded.plaintext_size - encoded.compressed_size);
  }

  const auto block_deadline = clock_->Now() + options_.block_timeout;

  for (;;) {
    const auto epoch = CapacityEpoch();
    const auto now   = clock_->Now();

    model::ItemId                result_id{};
    std::optional<model::ItemId> evicted;
    std::uint64_t                depth_after = 0;

    const auto outcome = Transact("enqueue", [&](db::Transaction& tx) {
      evicted.reset();
      if (idempotency_key) {
        if (auto existing = store_->FindLiveByIdempotencyKey(tx, *idempotency_key)) {
          result_id = existing->id;
          return EnqueueOutcome::kDeduplicated;
        }
      }

      db::StatusCounts counts;
      if (auto r = store_->CountByStatus(tx, counts); !r) Raise(r, "count items");
      std::uint64_t depth = 0;
      for (const auto& [status, n] : counts) {
        if (status != ItemStatus::kDead) depth += n;
      }

      if (depth >= options_.max_depth) {
        if (options_.overflow_policy != OverflowPolicy::kDropOldestLowPriority) {
          return EnqueueOutcome::kFull;
        }
        auto victim = store_->OldestPendingAtOrBelow(tx, priority);
        if (!victim) {
          return EnqueueOutcome::kFull;
        }
        if (auto r = store_->MarkDead(tx, victim->id, "Overflow", now); !r) Raise(r, "evict " + util::ToString(victim->id));
        evicted = victim->id;
        --depth;
      }

      db::model::ItemRecord record;
      record.id              = util::GenerateUUIDv7(now);
      record.idempotency_key = idempotency_key;
      record.priority        = priority;
      record.status          = ItemStatus::kPending;
      record.payload         = encoded.bytes;
      record.payload_codec   = encoded.tag;
      record.enqueued_at     = now;
      record.updated_at      = now;
      record.next_attempt_at = now;

      if (auto r = store_->Insert(tx, record); !r) Raise(r, "insert item");
      result_id   = record.id;
      depth_after = depth + 1;
      return EnqueueOutcome::kInserted;
    });

    switch (outcome) {
      case EnqueueOutcome::kDeduplicated:
        QueueStats::Add(stats_.deduplicated);
        observability::Metrics::Instance().RecordEnqueue(model::ToString(priority), "deduplicated");
        span.AddEvent("deduplicated");
        return result_id;

      case EnqueueOutcome::kInserted:
        QueueStats::Add(stats_.enqueued);
        stats_.ObserveDepth(depth_after);
        if (evicted) {
          QueueStats::Add(stats_.overflow_evictions);
          QueueStats::Add(stats_.dead_lettered);
          observability::Metrics::Instance().RecordDeadLetter("Overflow");
          SYNCQ_LOG_WARN("queue full, evicted oldest pending item",
                         {observability::ItemField(*evicted),
                          observability::StringField("priority", model::ToString(priority)), observability::StringField("reason", "Overflow")});
        }
        observability::Metrics::Instance().RecordEnqueue(model::ToString(priority), evicted ? "evicted" : "accepted");
        NotifyWake();
        return result_id;

      case EnqueueOutcome::kFull:
        break;
    }

    if (options_.overflow_policy == OverflowPolicy::kBlock && clock_->Now() < block_deadline) {
      if (WaitForCapacity(epoch, block_deadline)) continue;
    }

    QueueStats::Add(stats_.capacity_rejections);
    observability::Metrics::Instance().RecordEnqueue(model::ToString(priority), "rejected");
    throw util::QueueFull("queue at capacity (" + std::to_string(options_.max_depth) + " items, policy " +
                          std::string(ToString(options_.overflow_policy)) + ")");
  }
}

std::uint64_t SyncQueue::CapacityEpoch() {
  std::lock_guard lock(capacity_->mutex);
  return capacity_->epoch;
}

void SyncQueue::SignalCapacity() {
  {
    std::lock_guard lock(capacity_->mutex);
    ++capacity_->epoch;
  }
  capacity_->cv.notify_all();
}

bool SyncQueue::WaitForCapacity(std::uint64_t observed_epoch, util::TimePoint deadline) {
  auto signal  = capacity_;
  auto expired = std::make_shared<bool>(false);

  const auto remaining = std::chrono::duration_cast<util::Duration>(deadline - clock_->Now());
  const auto timer     = clock_->Schedule(remaining, [signal, expired] {
    {
      std::lock_guard lock(signal->mutex);
      *expired = true;
    }
    signal->cv.notify_all();
  });

  bool progressed = false;
  bool closed     = false;
  {
    std::unique_lock lock(signal->mutex);
    signal->cv.wait(lock, [&] { return *expired || signal->closed || signal->epoch != observed_epoch; });
    progressed = signal->epoch != observed_epoch;
    closed     = signal->closed;
  }
  clock_->Cancel(timer);

  if (closed) {
    throw util::ShuttingDown("queue is shutting down");
  }
  return progressed;
}

void SyncQueue::NotifyWake() {
  std::function<void()> listener;
  {
    std::lock_guard lock(hooks_mutex_);
    listener = wake_listener_;
  }
  if (listener) listener();
}

// ---------------------------------------------------------------------
// Reservation
// ---------------------------------------------------------------------

std::vector<Reservation> SyncQueue::Reserve(std::size_t limit) {
  observability::SpanScope span("syncq.reserve");
  if (limit == 0) {
    return {};
  }

  const auto         now = clock_->Now();
  db::ReserveRequest request;
  request.limit    = limit;
  request.now      = now;
  request.token    = util::ToString(util::GenerateUUIDv7(now));
  request.deadline = now + options_.reservation_ttl;

  std::vector<Reservation>                           out;
  std::vector<std::pair<model::ItemId, std::string>> undecodable;

  Transact("reserve", [&](db::Transaction& tx) {
    out.clear();
    undecodable.clear();

    std::vector<db::model::ItemRecord> records;
    if (auto r = store_->Reserve(tx, request, records); !r) Raise(r, "reserve");

    for (auto& record : records) {
      try {
        Reservation reservation;
        reservation.payload         = codec_->Decode(record.payload, record.payload_codec);
        reservation.handle          = {record.id, request.token};
        reservation.priority        = record.priority;
        reservation.attempts        = record.attempts;
        reservation.enqueued_at     = record.enqueued_at;
        reservation.idempotency_key = record.idempotency_key;
        out.push_back(std::move(reservation));
      } catch (const util::CodecError& e) {
        auto reason = model::TruncateError("Undecodable(" + std::string(e.what()) + ")", options_.last_error_max_len);

        db::FailUpdate update;
        update.next_status     = ItemStatus::kDead;
        update.next_attempt_at = now;
        update.last_error      = reason;
        update.now             = now;
        if (auto r = store_->Fail(tx, record.id, request.token, update); !r) Raise(r, "dead-letter " + util::ToString(record.id));
        undecodable.emplace_back(record.id, std::move(reason));
      }
    }
  });

  QueueStats::Add(stats_.reserved, out.size());
  span.SetAttribute("reserved", static_cast<std::int64_t>(out.size()));

  for (const auto& [id, reason] : undecodable) {
    QueueStats::Add(stats_.dead_lettered);
    observability::Metrics::Instance().RecordDeadLetter("Undecodable");
    SYNCQ_LOG_WARN("undecodable item moved to dead letters",
                   {observability::ItemField(id), observability::StringField("reason", reason)});
  }
  if (!undecodable.empty()) SignalCapacity();

  return out;
}

void SyncQueue::Commit(const ReservationHandle& handle) {
  observability::SpanScope span("syncq.commit");
  const auto               now = clock_->Now();

  Transact("commit", [&](db::Transaction& tx) {
    auto r = store_->Commit(tx, handle.id, handle.token, now);
    if (r.code == db::ErrorCode::Conflict) RejectTerminal(*store_, tx, handle.id, "commit");
    if (!r) Raise(r, "commit " + util::ToString(handle.id));
  });

  QueueStats::Add(stats_.committed);
  observability::Metrics::Instance().RecordDelivery("committed");
}

void SyncQueue::Fail(const ReservationHandle& handle, const Disposition& disposition) {
  observability::SpanScope span("syncq.fail");

  if (disposition.next_status != ItemStatus::kPending && disposition.next_status != ItemStatus::kDead) {
    throw util::IllegalTransition("fail " + util::ToString(handle.id) + ": cannot move InFlight to " +
                                  std::string(model::ToString(disposition.next_status)));
  }

  const auto     now = clock_->Now();
  db::FailUpdate update;
  update.next_status        = disposition.next_status;
  update.next_attempt_at    = disposition.next_attempt_at;
  update.attempts_increment = disposition.attempts_increment;
  update.now                = now;
  if (disposition.last_error) {
    update.last_error = model::TruncateError(*disposition.last_error, options_.last_error_max_len);
  }

  Transact("fail", [&](db::Transaction& tx) {
    auto r = store_->Fail(tx, handle.id, handle.token, update);
    if (r.code == db::ErrorCode::Conflict) RejectTerminal(*store_, tx, handle.id, "fail");
    if (!r) Raise(r, "fail " + util::ToString(handle.id));
  });

  if (disposition.next_status == ItemStatus::kDead) {
    QueueStats::Add(stats_.dead_lettered);
    observability::Metrics::Instance().RecordDelivery("dead");
    observability::Metrics::Instance().RecordDeadLetter(ReasonLabel(update.last_error ? *update.last_error : std::string_view("unknown")));
    SYNCQ_LOG_WARN("item moved to dead letters", {observability::ItemField(handle.id),
                                                  observability::StringField("reason", update.last_error.value_or(""))});
    SignalCapacity();
    return;
  }

  if (disposition.throttled) {
    QueueStats::Add(stats_.throttled);
    observability::Metrics::Instance().RecordDelivery("throttled");
  } else {
    QueueStats::Add(stats_.retried);
    observability::Metrics::Instance().RecordDelivery("retried");
  }
}

std::size_t SyncQueue::Reap() {
  observability::SpanScope span("syncq.reap");
  const auto               now = clock_->Now();

  std::vector<model::ItemId> reaped;
  Transact("reap", [&](db::Transaction& tx) {
    reaped.clear();
    if (auto r = store_->Reap(tx, now, reaped); !r) Raise(r, "reap");
  });

  if (!reaped.empty()) {
    QueueStats::Add(stats_.reaped, reaped.size());
    observability::Metrics::Instance().RecordReap(reaped.size());
    SYNCQ_LOG_INFO("returned expired reservations to pending", {observability::IntField("count", static_cast<std::int64_t>(reaped.size()))});
  }
  return reaped.size();
}

// ---------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------

model::ItemView SyncQueue::Inspect(const model::ItemId& id) {
  auto record = Transact("inspect", [&](db::Transaction& tx) { return store_->Get(tx, id); });
  if (!record) {
    throw util::NotFound("item " + util::ToString(id) + " not found");
  }
  return db::model::ToView(*record);
}

model::ItemStatus SyncQueue::Status(const model::ItemId& id) {
  return Inspect(id).status;
}

db::StatusCounts SyncQueue::DepthByStatus() {
  db::StatusCounts counts;
  Transact("count items", [&](db::Transaction& tx) {
    if (auto r = store_->CountByStatus(tx, counts); !r) Raise(r, "count items");
  });

  std::uint64_t live = 0;
  for (auto status : model::kAllStatuses) {
    auto& n = counts[status];
    observability::Metrics::Instance().SetDepth(model::ToString(status), n);
    if (status != ItemStatus::kDead) live += n;
  }
  stats_.ObserveDepth(live);
  return counts;
}

std::map<model::Priority, util::Duration> SyncQueue::OldestPendingAge() {
  std::map<model::Priority, util::TimePoint> oldest;
  Transact("oldest pending", [&](db::Transaction& tx) {
    if (auto r = store_->OldestPendingByPriority(tx, oldest); !r) Raise(r, "oldest pending");
  });

  const auto                                now = clock_->Now();
  std::map<model::Priority, util::Duration> ages;
  for (auto priority : model::kAllPriorities) {
    auto it = oldest.find(priority);
    if (it == oldest.end()) {
      observability::Metrics::Instance().SetOldestPendingAgeMs(model::ToString(priority), 0);
      continue;
    }
    const auto age  = util::Duration(std::max<std::int64_t>(ElapsedMs(it->second, now), 0));
    ages[priority] = age;
    observability::Metrics::Instance().SetOldestPendingAgeMs(model::ToString(priority), age.count());
  }
  return ages;
}

std::vector<model::ItemView> SyncQueue::DeadLetters(std::size_t limit) {
  std::vector<db::model::ItemRecord> records;
  Transact("dead letters", [&](db::Transaction& tx) {
    records.clear();
    if (auto r = store_->IterateDead(tx, limit, records); !r) Raise(r, "dead letters");
  });

  std::vector<model::ItemView> views;
  views.reserve(records.size());
  for (const auto& record : records) {
    views.push_back(db::model::ToView(record));
  }
  return views;
}

bool SyncQueue::Healthy() {
  if (degraded_.load()) {
    return false;
  }

  try {
    db::StatusCounts counts;
    auto result = db::WithTransaction(*store_, [&](db::Transaction& tx) { return store_->CountByStatus(tx, counts); });
    if (!result) {
      SYNCQ_LOG_WARN("health check query failed", {observability::StringField("error", result.message)});
      return false;
    }
    return true;
  } catch (const db::DbError& e) {
    SYNCQ_LOG_WARN("health check could not reach the store", {observability::StringField("error", e.what())});
    return false;
  }
}

// ---------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------

std::size_t SyncQueue::Purge(const std::vector<model::ItemId>& ids) {
  observability::SpanScope span("syncq.purge");

  std::size_t purged = 0;
  Transact("purge", [&](db::Transaction& tx) {
    std::vector<model::ItemId> existing;
    for (const auto& id : ids) {
      auto record = store_->Get(tx, id);
      if (!record) continue;
      if (!model::CanPurge(record->status)) {
        throw util::IllegalTransition("purge " + util::ToString(id) + ": item is " + std::string(model::ToString(record->status)));
      }
      existing.push_back(id);
    }
    if (auto r = store_->Purge(tx, existing); !r) Raise(r, "purge");
    purged = existing.size();
  });

  if (purged > 0) {
    SYNCQ_LOG_INFO("purged items", {observability::IntField("count", static_cast<std::int64_t>(purged))});
    SignalCapacity();
  }
  return purged;
}

RetentionResult SyncQueue::ApplyRetention() {
  observability::SpanScope span("syncq.retention");
  const auto               now   = clock_->Now();
  const auto               batch = options_.retention.sweep_batch_size;

  auto sweep = [&](ItemStatus status, util::Duration horizon) {
    std::size_t total = 0;
    for (;;) {
      std::size_t purged = 0;
      Transact("retention sweep", [&](db::Transaction& tx) {
        if (auto r = store_->PurgeOlderThan(tx, status, now - horizon, batch, purged); !r) Raise(r, "retention sweep");
      });
      total += purged;
      if (purged < batch) break;
    }
    return total;
  };

  RetentionResult result;
  result.committed_purged = sweep(ItemStatus::kCommitted, options_.retention.committed_horizon);
  result.dead_purged      = sweep(ItemStatus::kDead, options_.retention.dead_horizon);

  if (result.committed_purged > 0 || result.dead_purged > 0) {
    SYNCQ_LOG_INFO("retention sweep removed items", {observability::IntField("committed", static_cast<std::int64_t>(result.committed_purged)),
                                                     observability::IntField("dead", static_cast<std::int64_t>(result.dead_purged))});
  }
  if (result.committed_purged > 0) SignalCapacity();
  return result;
}

// ---------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------

void SyncQueue::SetWakeListener(std::function<void()> listener) {
  std::lock_guard lock(hooks_mutex_);
  wake_listener_ = std::move(listener);
}

void SyncQueue::SetDrainHook(std::function<void(util::Duration)> hook) {
  std::lock_guard lock(hooks_mutex_);
  drain_hook_ = std::move(hook);
}

void SyncQueue::Shutdown(util::Duration grace) {
  if (shutting_down_.exchange(true)) {
    return;
  }

  {
    std::lock_guard lock(capacity_->mutex);
    capacity_->closed = true;
  }
  capacity_->cv.notify_all();

  SYNCQ_LOG_INFO("queue shutting down", {observability::IntField("grace_ms", grace.count())});

  std::function<void(util::Duration)> hook;
  {
    std::lock_guard lock(hooks_mutex_);
    hook = drain_hook_;
  }
  if (hook) hook(grace);
}

} // namespace syncq::queue
