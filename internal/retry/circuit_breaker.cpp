#include "circuit_breaker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace syncq::retry {

std::string_view ToString(BreakerState state) {
  switch (state) {
    case BreakerState::kClosed:
      return "Closed";
    case BreakerState::kOpen:
      return "Open";
    case BreakerState::kHalfOpen:
      return "HalfOpen";
  }
  return "Unknown";
}

CircuitBreaker::CircuitBreaker(BreakerPolicy policy, std::shared_ptr<clock::Clock> clock) : policy_(policy), clock_(std::move(clock)) {
  if (policy_.failure_threshold == 0) policy_.failure_threshold = 1;
  if (policy_.success_threshold == 0) policy_.success_threshold = 1;
  if (policy_.half_open_probe_count == 0) policy_.half_open_probe_count = 1;
}

std::optional<CircuitBreaker::Transition> CircuitBreaker::EnterLocked(BreakerState next, clock::TimePoint now) {
  const auto previous = state_;
  state_              = next;
  failures_           = 0;
  successes_          = 0;
  probes_             = 0;
  if (next == BreakerState::kOpen) opened_at_ = now;
  if (previous == next) return std::nullopt;
  return Transition{previous, next};
}

std::optional<CircuitBreaker::Transition> CircuitBreaker::MaybeHalfOpenLocked(clock::TimePoint now) {
  if (state_ == BreakerState::kOpen && now >= opened_at_ + policy_.cool_off) {
    return EnterLocked(BreakerState::kHalfOpen, now);
  }
  return std::nullopt;
}

void CircuitBreaker::Notify(const std::optional<Transition>& transition) {
  if (!transition) return;

  SYNCQ_LOG_INFO("circuit breaker state change", {observability::StringField("from", ToString(transition->from)),
                                                  observability::StringField("to", ToString(transition->to))});
  observability::Metrics::Instance().RecordBreakerTransition(ToString(transition->to));

  Listener listener;
  {
    std::lock_guard lock(mutex_);
    listener = listener_;
  }
  if (listener) listener(transition->from, transition->to);
}

Permit CircuitBreaker::Acquire() {
  const auto                now = clock_->Now();
  std::optional<Transition> transition;
  Permit                    permit;
  {
    std::lock_guard lock(mutex_);
    transition = MaybeHalfOpenLocked(now);

    switch (state_) {
      case BreakerState::kClosed:
        permit.admitted = true;
        break;
      case BreakerState::kOpen:
        permit.until = opened_at_ + policy_.cool_off;
        break;
      case BreakerState::kHalfOpen:
        if (probes_ < policy_.half_open_probe_count) {
          ++probes_;
          permit.admitted = true;
        } else {
          // probes outstanding; their outcome will signal a state change
          permit.until = now + policy_.cool_off;
        }
        break;
    }
  }
  Notify(transition);
  return permit;
}

void CircuitBreaker::RecordSuccess() {
  const auto                now = clock_->Now();
  std::optional<Transition> transition;
  {
    std::lock_guard lock(mutex_);
    switch (state_) {
      case BreakerState::kClosed:
        if (policy_.reset_on_success) failures_ = 0;
        break;
      case BreakerState::kHalfOpen:
        if (probes_ > 0) --probes_;
        if (++successes_ >= policy_.success_threshold) transition = EnterLocked(BreakerState::kClosed, now);
        break;
      case BreakerState::kOpen:
        // a call admitted before the circuit opened; nothing to learn
        break;
    }
  }
  Notify(transition);
}

void CircuitBreaker::RecordFailure() {
  const auto                now = clock_->Now();
  std::optional<Transition> transition;
  {
    std::lock_guard lock(mutex_);
    switch (state_) {
      case BreakerState::kClosed:
        if (++failures_ >= policy_.failure_threshold) transition = EnterLocked(BreakerState::kOpen, now);
        break;
      case BreakerState::kHalfOpen:
        transition = EnterLocked(BreakerState::kOpen, now);
        break;
      case BreakerState::kOpen:
        break;
    }
  }
  Notify(transition);
}

void CircuitBreaker::Release() {
  std::lock_guard lock(mutex_);
  if (state_ == BreakerState::kHalfOpen && probes_ > 0) --probes_;
}

BreakerState CircuitBreaker::State() {
  const auto                now = clock_->Now();
  std::optional<Transition> transition;
  BreakerState              state;
  {
    std::lock_guard lock(mutex_);
    transition = MaybeHalfOpenLocked(now);
    state      = state_;
  }
  Notify(transition);
  return state;
}

std::optional<clock::TimePoint> CircuitBreaker::NextProbeAt() {
  std::lock_guard lock(mutex_);
  if (state_ != BreakerState::kOpen) return std::nullopt;
  return opened_at_ + policy_.cool_off;
}

void CircuitBreaker::SetListener(Listener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

} // namespace syncq::retry
