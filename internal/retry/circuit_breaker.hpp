#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "internal/clock/clock.hpp"

namespace syncq::retry {

enum class BreakerState : std::uint8_t {
  kClosed,
  kOpen,
  kHalfOpen,
};

std::string_view ToString(BreakerState state);

struct BreakerPolicy {
  std::uint32_t   failure_threshold = 5;
  std::uint32_t   success_threshold = 2;
  clock::Duration cool_off{30000};
  std::uint32_t   half_open_probe_count = 1;
  // in Closed, a success clears the consecutive failure count
  bool            reset_on_success = true;
};

struct Permit {
  bool             admitted = false;
  clock::TimePoint until{}; // earliest retry when rejected
};

/*
  Three-state circuit breaker.

  Closed:   failures count up; failure_threshold opens the circuit.
  Open:     every Acquire() is rejected until opened_at + cool_off, then
            the breaker moves to HalfOpen.
  HalfOpen: at most half_open_probe_count permits are outstanding;
            success_threshold successes close the circuit, any failure
            reopens it with a fresh opened_at.

  Counters reset on every state entry. Each admitted permit must end in
  exactly one RecordSuccess, RecordFailure or Release. The listener runs
  after the state lock is dropped.
*/
class CircuitBreaker {
 public:
  using Listener = std::function<void(BreakerState from, BreakerState to)>;

  CircuitBreaker(BreakerPolicy policy, std::shared_ptr<clock::Clock> clock);

  Permit Acquire();

  void RecordSuccess();
  void RecordFailure();

  // permit granted but no call was made
  void Release();

  BreakerState State();

  // opened_at + cool_off while Open
  std::optional<clock::TimePoint> NextProbeAt();

  void SetListener(Listener listener);

 private:
  struct Transition {
    BreakerState from;
    BreakerState to;
  };

  // caller holds mutex_
  std::optional<Transition> EnterLocked(BreakerState next, clock::TimePoint now);
  std::optional<Transition> MaybeHalfOpenLocked(clock::TimePoint now);
  void                      Notify(const std::optional<Transition>& transition);

  BreakerPolicy                 policy_;
  std::shared_ptr<clock::Clock> clock_;

  std::mutex       mutex_;
  BreakerState     state_ = BreakerState::kClosed;
  std::uint32_t    failures_  = 0;
  std::uint32_t    successes_ = 0;
  std::uint32_t    probes_    = 0; // outstanding half-open permits
  clock::TimePoint opened_at_{};
  Listener         listener_;
};

} // namespace syncq::retry
