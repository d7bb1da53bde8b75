#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "circuit_breaker.hpp"
#include "internal/clock/clock.hpp"
#include "internal/model/item.hpp"
#include "retry_budget.hpp"
#include "retry_strategy.hpp"

namespace syncq::retry {

struct RetryDecision {
  enum class Verdict : std::uint8_t {
    kRetryAfter, // back to Pending at next_attempt_at
    kDeadLetter, // Exhausted or NonRetryable
  };

  Verdict          verdict = Verdict::kRetryAfter;
  clock::TimePoint next_attempt_at{};
  std::string      reason;
};

/*
  RetryEngine

  Composes strategy, budget and breaker for the worker:

    - Admit() gates the forwarder call on the breaker.
    - FundAttempt() charges the budget for each reserved retry (attempts
      counted so far >= 2). An unfunded retry is not forwarded; the item
      waits until ThrottledUntil().
    - RecordBatch() feeds the batch outcome to the breaker; call it before
      OnFailure() so next_attempt_at sees the resulting breaker state.
    - OnFailure() asks the strategy.
      next_attempt_at = max(now + delay, breaker next probe).

  The previous delay of each item is remembered for decorrelated jitter
  until Forget() is called on commit or dead-letter.
*/
class RetryEngine {
 public:
  RetryEngine(RetryPolicy retry, BudgetPolicy budget, BreakerPolicy breaker, std::shared_ptr<clock::Clock> clock, std::uint64_t seed = 0);

  Permit Admit();
  void   ReleasePermit();
  void   RecordBatch(bool success);

  // attempts includes the reservation being funded; first attempts are free
  bool             FundAttempt(std::uint32_t attempts);
  clock::TimePoint ThrottledUntil();

  RetryDecision OnFailure(const model::ItemId& id, std::uint32_t attempts, ErrorClass error);

  void Forget(const model::ItemId& id);

  CircuitBreaker& Breaker() {
    return breaker_;
  }

  RetryBudget& Budget() {
    return budget_;
  }

  RetryStrategy& Strategy() {
    return strategy_;
  }

 private:
  std::shared_ptr<clock::Clock> clock_;
  RetryStrategy                 strategy_;
  RetryBudget                   budget_;
  CircuitBreaker                breaker_;

  std::mutex                             delays_mutex_;
  std::map<model::ItemId, util::Duration> previous_delays_;
};

} // namespace syncq::retry
