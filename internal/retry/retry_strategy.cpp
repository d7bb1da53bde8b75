#include "retry_strategy.hpp"

#include <algorithm>
#include <limits>

namespace syncq::retry {

std::string_view ToString(ErrorClass error) {
  switch (error) {
    case ErrorClass::kRetryable:
      return "Retryable";
    case ErrorClass::kNonRetryable:
      return "NonRetryable";
    case ErrorClass::kAuth:
      return "Auth";
    case ErrorClass::kTimeout:
      return "Timeout";
  }
  return "Unknown";
}

RetryStrategy::RetryStrategy(RetryPolicy policy, std::uint64_t seed)
    : policy_(policy), rng_(seed != 0 ? seed : std::random_device{}()) {
}

Duration RetryStrategy::Backoff(std::uint32_t attempts) const {
  const auto base = static_cast<std::uint64_t>(std::max<std::int64_t>(policy_.base_delay.count(), 0));
  const auto cap  = static_cast<std::uint64_t>(std::max<std::int64_t>(policy_.max_delay.count(), 0));

  const std::uint32_t exponent = std::min(attempts == 0 ? 0u : attempts - 1, policy_.max_exponent);

  // base << exponent without wrapping: anything past cap is cap
  std::uint64_t delay = cap;
  if (exponent < 64 && base <= (cap >> exponent)) {
    delay = base << exponent;
  }
  return Duration(static_cast<std::int64_t>(std::min(delay, cap)));
}

StrategyDecision RetryStrategy::Decide(std::uint32_t attempts, ErrorClass error, std::optional<Duration> previous_delay) {
  if (error == ErrorClass::kNonRetryable) {
    return {StrategyDecision::Kind::kNonRetryable, Duration(0)};
  }
  if (attempts >= policy_.max_attempts) {
    return {StrategyDecision::Kind::kExhausted, Duration(0)};
  }

  auto delay = Jitter(Backoff(attempts), previous_delay);
  if (error == ErrorClass::kAuth) {
    delay = std::max(delay, policy_.auth_floor);
  }
  delay = std::clamp(delay, Duration(0), std::max(policy_.max_delay, Duration(0)));
  return {StrategyDecision::Kind::kRetry, delay};
}

Duration RetryStrategy::Uniform(Duration lo, Duration hi) {
  if (hi <= lo) return lo;
  std::uniform_int_distribution<std::int64_t> dist(lo.count(), hi.count());
  std::lock_guard                             lock(rng_mutex_);
  return Duration(dist(rng_));
}

Duration RetryStrategy::Jitter(Duration delay, std::optional<Duration> previous_delay) {
  switch (policy_.jitter) {
    case JitterMode::kNone:
      return delay;
    case JitterMode::kFull:
      return Uniform(Duration(0), delay);
    case JitterMode::kEqual: {
      const Duration half = delay / 2;
      return half + Uniform(Duration(0), delay - half);
    }
    case JitterMode::kDecorrelated: {
      const auto prev = previous_delay.value_or(policy_.base_delay);
      // 3 * prev, saturating
      const auto tripled = prev.count() > std::numeric_limits<std::int64_t>::max() / 3 ? policy_.max_delay : prev * 3;
      const auto upper   = std::min(policy_.max_delay, tripled);
      return Uniform(policy_.base_delay, std::max(upper, policy_.base_delay));
    }
  }
  return delay;
}

} // namespace syncq::retry
