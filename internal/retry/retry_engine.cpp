#include "retry_engine.hpp"

#include <algorithm>

namespace syncq::retry {

RetryEngine::RetryEngine(RetryPolicy retry, BudgetPolicy budget, BreakerPolicy breaker, std::shared_ptr<clock::Clock> clock, std::uint64_t seed)
    : clock_(clock), strategy_(retry, seed), budget_(budget, clock), breaker_(breaker, clock) {
}

Permit RetryEngine::Admit() {
  return breaker_.Acquire();
}

void RetryEngine::ReleasePermit() {
  breaker_.Release();
}

void RetryEngine::RecordBatch(bool success) {
  if (success) {
    breaker_.RecordSuccess();
  } else {
    breaker_.RecordFailure();
  }
}

bool RetryEngine::FundAttempt(std::uint32_t attempts) {
  if (attempts < 2) return true;
  return budget_.TryConsume();
}

clock::TimePoint RetryEngine::ThrottledUntil() {
  return clock_->Now() + budget_.RefillInterval();
}

RetryDecision RetryEngine::OnFailure(const model::ItemId& id, std::uint32_t attempts, ErrorClass error) {
  const auto now = clock_->Now();

  std::optional<util::Duration> previous;
  {
    std::lock_guard lock(delays_mutex_);
    if (auto it = previous_delays_.find(id); it != previous_delays_.end()) previous = it->second;
  }

  const auto decision = strategy_.Decide(attempts, error, previous);
  switch (decision.kind) {
    case StrategyDecision::Kind::kNonRetryable:
      Forget(id);
      return {RetryDecision::Verdict::kDeadLetter, now, "NonRetryable"};
    case StrategyDecision::Kind::kExhausted:
      Forget(id);
      return {RetryDecision::Verdict::kDeadLetter, now, "Exhausted"};
    case StrategyDecision::Kind::kRetry:
      break;
  }

  {
    std::lock_guard lock(delays_mutex_);
    previous_delays_[id] = decision.delay;
  }

  auto next = now + decision.delay;
  if (auto probe = breaker_.NextProbeAt()) next = std::max(next, *probe);
  return {RetryDecision::Verdict::kRetryAfter, next, "Retry"};
}

void RetryEngine::Forget(const model::ItemId& id) {
  std::lock_guard lock(delays_mutex_);
  previous_delays_.erase(id);
}

} // namespace syncq::retry
