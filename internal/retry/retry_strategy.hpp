#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

#include "internal/util/time.hpp"

namespace syncq::retry {

using Duration = util::Duration;

// How a delivery attempt failed, as reported by the forwarder.
enum class ErrorClass : std::uint8_t {
  kRetryable,
  kNonRetryable,
  kAuth,    // retryable, with auth_floor as minimum delay
  kTimeout, // retryable, and a breaker failure
};

std::string_view ToString(ErrorClass error);

enum class JitterMode : std::uint8_t {
  kNone,
  kFull,         // U[0, d]
  kEqual,        // d/2 + U[0, d/2]
  kDecorrelated, // U[base, min(cap, 3 * previous)]
};

struct RetryPolicy {
  Duration      base_delay{1000};
  Duration      max_delay{3600000};
  std::uint32_t max_exponent = 10;
  std::uint32_t max_attempts = 5;
  JitterMode    jitter       = JitterMode::kNone;
  Duration      auth_floor{60000};
};

struct StrategyDecision {
  enum class Kind : std::uint8_t { kRetry, kExhausted, kNonRetryable };

  Kind     kind = Kind::kRetry;
  Duration delay{0};
};

/*
  RetryStrategy

  attempts is the number of delivery attempts already made, including
  the one that just failed (reserve counts them). Before jitter:

    delay = min(base * 2^min(attempts - 1, max_exponent), cap)

  so the first failure waits base. attempts >= max_attempts is
  Exhausted. Every returned delay is within [0, cap].
*/
class RetryStrategy {
 public:
  // seed 0 draws a seed from std::random_device
  explicit RetryStrategy(RetryPolicy policy, std::uint64_t seed = 0);

  StrategyDecision Decide(std::uint32_t attempts, ErrorClass error, std::optional<Duration> previous_delay = std::nullopt);

  // un-jittered exponential delay
  Duration Backoff(std::uint32_t attempts) const;

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  Duration Jitter(Duration delay, std::optional<Duration> previous_delay);
  Duration Uniform(Duration lo, Duration hi);

  RetryPolicy     policy_;
  std::mutex      rng_mutex_;
  std::mt19937_64 rng_;
};

} // namespace syncq::retry
