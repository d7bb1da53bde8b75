#include "outbox_worker.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace syncq::worker {

namespace {

retry::ErrorClass Classify(ForwardResult::Kind kind) {
  switch (kind) {
    case ForwardResult::Kind::kNonRetryable:
      return retry::ErrorClass::kNonRetryable;
    case ForwardResult::Kind::kAuth:
      return retry::ErrorClass::kAuth;
    case ForwardResult::Kind::kTimeout:
      return retry::ErrorClass::kTimeout;
    case ForwardResult::Kind::kOk:
    case ForwardResult::Kind::kRetryable:
      break;
  }
  return retry::ErrorClass::kRetryable;
}

std::string DescribeFailure(const ForwardResult& result) {
  switch (result.kind) {
    case ForwardResult::Kind::kRetryable:
      return "Retryable(" + result.reason + ")";
    case ForwardResult::Kind::kNonRetryable:
      return "NonRetryable(" + result.reason + ")";
    case ForwardResult::Kind::kAuth:
      return "Auth";
    case ForwardResult::Kind::kTimeout:
      return "Timeout";
    case ForwardResult::Kind::kOk:
      break;
  }
  return "Ok";
}

// run one disposition write; losing the reservation is logged, not raised
template <typename F>
void Disposing(const queue::ReservationHandle& handle, F&& write) {
  try {
    write();
  } catch (const util::StaleReservation& e) {
    SYNCQ_LOG_WARN("reservation lost before disposition", {observability::ItemField(handle.id),
                                                           observability::StringField("error", e.what())});
  } catch (const util::IllegalTransition& e) {
    SYNCQ_LOG_WARN("disposition rejected", {observability::ItemField(handle.id),
                                            observability::StringField("error", e.what())});
  } catch (const util::NotFound& e) {
    SYNCQ_LOG_WARN("item vanished before disposition", {observability::ItemField(handle.id),
                                                        observability::StringField("error", e.what())});
  } catch (const util::StoreTransient& e) {
    SYNCQ_LOG_WARN("disposition not written, reservation left for reap", {observability::ItemField(handle.id),
                                                                          observability::StringField("error", e.what())});
  }
}

// returns how many reservations were reaped
std::size_t Sweep(queue::SyncQueue& queue) {
  std::size_t reaped = 0;
  try {
    reaped = queue.Reap();
    queue.ApplyRetention();
  } catch (const std::exception& e) {
    SYNCQ_LOG_ERROR("maintenance pass failed", {observability::StringField("error", e.what())});
  }
  return reaped;
}

} // namespace

struct OutboxWorker::BatchState {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    in_batch = false;
};

/*
  Self-rearming reap/retention timer. Callbacks hold a reference to this
  state, not to the worker, so a timer firing during shutdown is safe.
*/
struct OutboxWorker::Maintenance : std::enable_shared_from_this<Maintenance> {
  std::shared_ptr<queue::SyncQueue> queue;
  std::shared_ptr<clock::Clock>     clock;
  util::Duration                    interval;
  std::shared_ptr<WakeSignal>       wake;

  std::mutex                    mutex;
  std::optional<clock::TimerId> timer;
  bool                          stopped = false;

  Maintenance(std::shared_ptr<queue::SyncQueue> q, std::shared_ptr<clock::Clock> c, util::Duration i, std::shared_ptr<WakeSignal> w)
      : queue(std::move(q)), clock(std::move(c)), interval(i), wake(std::move(w)) {
  }

  void Arm() {
    std::lock_guard lock(mutex);
    if (stopped || interval.count() <= 0) return;
    auto self = shared_from_this();
    timer     = clock->Schedule(interval, [self] { self->Fire(); });
  }

  void Fire() {
    {
      std::lock_guard lock(mutex);
      if (stopped) return;
      timer.reset();
    }
    const auto reaped = Sweep(*queue);
    // recovered items are due now; a degraded queue must stop the loop
    if (reaped > 0 || queue->Degraded()) wake->Notify();
    Arm();
  }

  void Stop() {
    std::optional<clock::TimerId> pending;
    {
      std::lock_guard lock(mutex);
      stopped = true;
      pending = timer;
      timer.reset();
    }
    if (pending) clock->Cancel(*pending);
  }
};

OutboxWorker::OutboxWorker(std::shared_ptr<queue::SyncQueue> queue, std::shared_ptr<retry::RetryEngine> engine, std::shared_ptr<Forwarder> forwarder,
                           std::shared_ptr<clock::Clock> clock, WorkerOptions options)
    : queue_(std::move(queue)), engine_(std::move(engine)), forwarder_(std::move(forwarder)), clock_(std::move(clock)), options_(options),
      wake_(std::make_shared<WakeSignal>()), batch_(std::make_shared<BatchState>()) {
  if (options_.batch_size == 0) options_.batch_size = 1;

  auto wake = wake_;
  queue_->SetWakeListener([wake] { wake->Notify(); });
  queue_->SetDrainHook([this](util::Duration grace) { Drain(grace); });
  engine_->Breaker().SetListener([wake](retry::BreakerState, retry::BreakerState to) {
    if (to != retry::BreakerState::kOpen) wake->Notify();
  });
}

OutboxWorker::~OutboxWorker() {
  Stop();
  if (thread_.joinable()) thread_.join();
  queue_->SetDrainHook(nullptr);
  queue_->SetWakeListener(nullptr);
  engine_->Breaker().SetListener(nullptr);
}

bool OutboxWorker::Start() {
  if (running_.load()) return false;
  // a previous run may have ended on its own (fatal error, drain timeout)
  if (thread_.joinable()) thread_.join();

  wake_->Reset();
  running_ = true;

  {
    std::lock_guard lock(timers_mutex_);
    maintenance_ = std::make_shared<Maintenance>(queue_, clock_, options_.maintenance_interval, wake_);
  }
  maintenance_->Arm();

  thread_ = std::thread(&OutboxWorker::Run, this);
  wake_->Notify();

  SYNCQ_LOG_INFO("outbox worker started", {observability::IntField("batch_size", static_cast<std::int64_t>(options_.batch_size)),
                                           observability::IntField("poll_interval_ms", options_.poll_interval.count())});
  return true;
}

bool OutboxWorker::Stop() {
  return Drain(options_.join_timeout);
}

bool OutboxWorker::Drain(util::Duration grace) {
  const bool was_running = running_.exchange(false);
  if (!was_running && !thread_.joinable()) return false;

  wake_->Shutdown();
  CancelWake();

  std::shared_ptr<Maintenance> maintenance;
  {
    std::lock_guard lock(timers_mutex_);
    maintenance = std::move(maintenance_);
  }
  if (maintenance) maintenance->Stop();

  auto       batch   = batch_;
  auto       expired = std::make_shared<bool>(false);
  const auto timer   = clock_->Schedule(grace, [batch, expired] {
    {
      std::lock_guard lock(batch->mutex);
      *expired = true;
    }
    batch->cv.notify_all();
  });

  bool finished = false;
  {
    std::unique_lock lock(batch->mutex);
    batch->cv.wait(lock, [&] { return !batch->in_batch || *expired; });
    finished = !batch->in_batch;
  }
  clock_->Cancel(timer);

  if (!finished) {
    SYNCQ_LOG_WARN("drain grace expired with a batch in flight; its reservations are left for reap",
                   {observability::IntField("grace_ms", grace.count())});
    return true;
  }

  if (thread_.joinable()) thread_.join();
  SYNCQ_LOG_INFO("outbox worker stopped");
  return true;
}

void OutboxWorker::Run() {
  while (wake_->Wait()) {
    if (!running_.load()) break;

    util::TimePoint next;
    try {
      next = RunOnce();
    } catch (const util::StoreFatal& e) {
      SYNCQ_LOG_ERROR("outbox worker stopping on fatal store error", {observability::StringField("error", e.what())});
      running_ = false;
      break;
    } catch (const std::exception& e) {
      SYNCQ_LOG_WARN("outbox worker pass failed", {observability::StringField("error", e.what())});
      next = clock_->Now() + options_.poll_interval;
    }

    if (queue_->Degraded()) {
      SYNCQ_LOG_ERROR("outbox worker stopping, queue degraded");
      running_ = false;
      break;
    }
    if (!running_.load()) break;

    ArmWake(next);
  }
}

void OutboxWorker::ArmWake(util::TimePoint at) {
  CancelWake();

  const auto now = clock_->Now();
  if (at <= now) {
    wake_->Notify();
    return;
  }

  auto       wake = wake_;
  const auto id   = clock_->Schedule(std::chrono::ceil<util::Duration>(at - now), [wake] { wake->Notify(); });

  std::lock_guard lock(timers_mutex_);
  wake_timer_ = id;
}

void OutboxWorker::CancelWake() {
  std::optional<clock::TimerId> pending;
  {
    std::lock_guard lock(timers_mutex_);
    pending = wake_timer_;
    wake_timer_.reset();
  }
  if (pending) clock_->Cancel(*pending);
}

void OutboxWorker::RunMaintenance() {
  queue_->Reap();
  queue_->ApplyRetention();
}

util::TimePoint OutboxWorker::RunOnce() {
  observability::SpanScope span("syncq.worker.pass");

  const auto permit = engine_->Admit();
  if (!permit.admitted) {
    span.AddEvent("breaker_rejected");
    return permit.until;
  }

  // a timed-out call that is still running keeps the forwarder busy
  if (const auto outstanding = outstanding_->load(); outstanding > 0) {
    engine_->ReleasePermit();
    span.AddEvent("forwarder_busy");
    SYNCQ_LOG_WARN("abandoned forwarder call still running, pass skipped",
                   {observability::IntField("outstanding", static_cast<std::int64_t>(outstanding))});
    return clock_->Now() + options_.poll_interval;
  }

  struct BatchScope {
    std::shared_ptr<BatchState> state;
    explicit BatchScope(std::shared_ptr<BatchState> s) : state(std::move(s)) {
      std::lock_guard lock(state->mutex);
      state->in_batch = true;
    }
    ~BatchScope() {
      {
        std::lock_guard lock(state->mutex);
        state->in_batch = false;
      }
      state->cv.notify_all();
    }
  } scope(batch_);

  std::vector<queue::Reservation> reservations;
  try {
    reservations = queue_->Reserve(options_.batch_size);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    engine_->ReleasePermit();
    throw;
  }

  const auto next_pass = [&] {
    // a full batch suggests more work is ready
    return reservations.size() >= options_.batch_size ? clock_->Now() : clock_->Now() + options_.poll_interval;
  };

  // retries the budget cannot fund never reach the forwarder
  std::vector<const queue::Reservation*> funded;
  funded.reserve(reservations.size());
  for (const auto& reservation : reservations) {
    if (engine_->FundAttempt(reservation.attempts)) {
      funded.push_back(&reservation);
    } else {
      Withhold(reservation);
    }
  }

  if (funded.empty()) {
    engine_->ReleasePermit();
    if (!reservations.empty()) span.AddEvent("budget_exhausted");
    return next_pass();
  }

  std::vector<OutboundItem> outbound;
  outbound.reserve(funded.size());
  for (const auto* reservation : funded) {
    outbound.push_back({reservation->handle.id, reservation->payload, reservation->attempts, reservation->priority});
  }
  span.SetAttribute("batch_size", static_cast<std::int64_t>(outbound.size()));

  const auto started = clock_->Now();
  auto       results = Send(outbound);
  observability::Metrics::Instance().ObserveBatchLatencyMs(
      std::chrono::duration<double, std::milli>(clock_->Now() - started).count());

  if (results.size() != outbound.size()) {
    SYNCQ_LOG_WARN("forwarder result count mismatch", {observability::IntField("expected", static_cast<std::int64_t>(outbound.size())),
                                                       observability::IntField("got", static_cast<std::int64_t>(results.size()))});
    results.assign(outbound.size(), ForwardResult::Retryable("forwarder returned " + std::to_string(results.size()) + " results for " +
                                                             std::to_string(outbound.size()) + " items"));
  }

  const bool success = std::all_of(results.begin(), results.end(), [](const ForwardResult& r) {
    return r.kind == ForwardResult::Kind::kOk || r.kind == ForwardResult::Kind::kNonRetryable;
  });
  engine_->RecordBatch(success);

  for (std::size_t i = 0; i < funded.size(); ++i) {
    Dispose(*funded[i], results[i]);
  }
  return next_pass();
}

void OutboxWorker::Dispose(const queue::Reservation& reservation, const ForwardResult& result) {
  const auto& handle = reservation.handle;

  Disposing(handle, [&] {
    if (result.kind == ForwardResult::Kind::kOk) {
      queue_->Commit(handle);
      engine_->Forget(handle.id);
      return;
    }

    const auto decision = engine_->OnFailure(handle.id, reservation.attempts, Classify(result.kind));

    queue::Disposition disposition;
    disposition.next_attempt_at = decision.next_attempt_at;
    disposition.last_error      = DescribeFailure(result);
    disposition.next_status =
        decision.verdict == retry::RetryDecision::Verdict::kDeadLetter ? model::ItemStatus::kDead : model::ItemStatus::kPending;
    queue_->Fail(handle, disposition);

    if (decision.verdict == retry::RetryDecision::Verdict::kDeadLetter) {
      SYNCQ_LOG_WARN("delivery abandoned", {observability::ItemField(handle.id),
                                            observability::StringField("priority", model::ToString(reservation.priority)),
                                            observability::IntField("attempts", reservation.attempts),
                                            observability::StringField("reason", decision.reason)});
    }
  });
}

void OutboxWorker::Withhold(const queue::Reservation& reservation) {
  const auto& handle = reservation.handle;

  Disposing(handle, [&] {
    queue::Disposition disposition;
    disposition.next_status        = model::ItemStatus::kPending;
    disposition.next_attempt_at    = engine_->ThrottledUntil();
    disposition.attempts_increment = -1;
    disposition.throttled          = true;
    queue_->Fail(handle, disposition);

    SYNCQ_LOG_WARN("retry budget exhausted, item throttled", {observability::ItemField(handle.id),
                                                              observability::IntField("attempts", reservation.attempts - 1)});
  });
}

std::vector<ForwardResult> OutboxWorker::Send(const std::vector<OutboundItem>& items) {
  auto all = [&](const ForwardResult& r) { return std::vector<ForwardResult>(items.size(), r); };

  if (options_.send_timeout.count() <= 0) {
    try {
      return forwarder_->SendBatch(items);
    } catch (const std::exception& e) {
      SYNCQ_LOG_WARN("forwarder failed", {observability::StringField("error", e.what())});
      return all(ForwardResult::Retryable(e.what()));
    }
  }

  // the call runs on its own thread and races a timer on the clock
  struct Call {
    std::mutex                 mutex;
    std::condition_variable    cv;
    bool                       done      = false;
    bool                       timed_out = false;
    std::vector<ForwardResult> results;
    std::exception_ptr         error;
  };

  auto call        = std::make_shared<Call>();
  auto forwarder   = forwarder_;
  auto outstanding = outstanding_;
  outstanding->fetch_add(1);
  std::thread([call, forwarder, outstanding, items] {
    std::vector<ForwardResult> results;
    std::exception_ptr         error;
    try {
      results = forwarder->SendBatch(items);
    } catch (...) {
      error = std::current_exception();
    }
    outstanding->fetch_sub(1);
    {
      std::lock_guard lock(call->mutex);
      call->results = std::move(results);
      call->error   = error;
      call->done    = true;
    }
    call->cv.notify_all();
  }).detach();

  const auto timer = clock_->Schedule(options_.send_timeout, [call] {
    {
      std::lock_guard lock(call->mutex);
      call->timed_out = true;
    }
    call->cv.notify_all();
  });

  std::unique_lock lock(call->mutex);
  call->cv.wait(lock, [&] { return call->done || call->timed_out; });
  const bool done = call->done;
  lock.unlock();
  clock_->Cancel(timer);

  if (!done) {
    SYNCQ_LOG_WARN("forwarder timed out", {observability::IntField("timeout_ms", options_.send_timeout.count()),
                                           observability::IntField("items", static_cast<std::int64_t>(items.size())),
                                           observability::IntField("outstanding", static_cast<std::int64_t>(outstanding_->load()))});
    return all(ForwardResult::Timeout());
  }

  if (call->error) {
    try {
      std::rethrow_exception(call->error);
    } catch (const std::exception& e) {
      SYNCQ_LOG_WARN("forwarder failed", {observability::StringField("error", e.what())});
      return all(ForwardResult::Retryable(e.what()));
    }
  }
  return std::move(call->results);
}

} // namespace syncq::worker
