#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "forwarder.hpp"
#include "internal/clock/clock.hpp"
#include "internal/queue/sync_queue.hpp"
#include "internal/retry/retry_engine.hpp"
#include "wake_signal.hpp"

namespace syncq::worker {

struct WorkerOptions {
  std::size_t    batch_size = 100;
  util::Duration poll_interval{60000};
  // 0 calls the forwarder inline without a deadline
  util::Duration send_timeout{30000};
  util::Duration maintenance_interval{300000};
  // grace used by Stop()
  util::Duration join_timeout{5000};
};

/*
  Background worker that delivers queued items through the Forwarder.

  One pass (RunOnce):
      breaker permit -> reserve -> budget -> send -> breaker outcome -> commit/fail

  Retries the budget cannot fund are handed back to Pending without being
  sent. While a timed-out forwarder call is still running no new batch
  is sent.

  The loop sleeps until the earliest of: the poll interval, an enqueue,
  a breaker state change, or the time returned by RunOnce. A maintenance
  timer on the Clock runs reap and the retention sweep.

  A fatal store error stops the loop; transient ones are logged and
  retried after the poll interval.
*/
class OutboxWorker {
 public:
  OutboxWorker(std::shared_ptr<queue::SyncQueue> queue, std::shared_ptr<retry::RetryEngine> engine, std::shared_ptr<Forwarder> forwarder,
               std::shared_ptr<clock::Clock> clock, WorkerOptions options = {});
  ~OutboxWorker();

  OutboxWorker(const OutboxWorker&)            = delete;
  OutboxWorker& operator=(const OutboxWorker&) = delete;

  // false when already running
  bool Start();

  // Drain(join_timeout); false when not running
  bool Stop();

  // finish the batch in progress (waiting up to grace), then stop
  bool Drain(util::Duration grace);

  bool Running() const {
    return running_.load();
  }

  // one pass; returns when the next pass is due
  util::TimePoint RunOnce();

  // reap + retention
  void RunMaintenance();

  // timed-out forwarder calls that have not returned yet
  std::size_t OutstandingCalls() const {
    return outstanding_->load();
  }

 private:
  struct Maintenance;
  struct BatchState;

  void Run();
  void ArmWake(util::TimePoint at);
  void CancelWake();

  std::vector<ForwardResult> Send(const std::vector<OutboundItem>& items);
  void                       Dispose(const queue::Reservation& reservation, const ForwardResult& result);
  void                       Withhold(const queue::Reservation& reservation);

  std::shared_ptr<queue::SyncQueue>   queue_;
  std::shared_ptr<retry::RetryEngine> engine_;
  std::shared_ptr<Forwarder>          forwarder_;
  std::shared_ptr<clock::Clock>       clock_;
  WorkerOptions                       options_;

  std::shared_ptr<WakeSignal> wake_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  // shared with forwarder call threads, which may outlive a pass
  std::shared_ptr<std::atomic<std::size_t>> outstanding_ = std::make_shared<std::atomic<std::size_t>>(0);

  std::mutex                    timers_mutex_;
  std::optional<clock::TimerId> wake_timer_;
  std::shared_ptr<Maintenance>  maintenance_;

  // tracks the pass between permit and its last disposition
  std::shared_ptr<BatchState> batch_;
};

} // namespace syncq::worker
