#pragma once

#include "item.hpp"

namespace syncq::model {

/*
  Item lifecycle.

    Pending  -> InFlight            reserve
    Pending  -> Dead                overflow eviction
    InFlight -> Committed           commit
    InFlight -> Pending             fail (retry, throttle, breaker) or reap
    InFlight -> Dead                fail (exhausted, non-retryable, undecodable)

  Committed and Dead are terminal; they only leave the store by purge.
*/

constexpr bool IsTerminal(ItemStatus status) {
  return status == ItemStatus::kCommitted || status == ItemStatus::kDead;
}

constexpr bool CanTransition(ItemStatus from, ItemStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == ItemStatus::kPending) {
    return to == ItemStatus::kInFlight || to == ItemStatus::kDead;
  }
  // InFlight
  return to == ItemStatus::kCommitted || to == ItemStatus::kPending || to == ItemStatus::kDead;
}

// purge only removes items that can no longer change
constexpr bool CanPurge(ItemStatus status) {
  return IsTerminal(status);
}

} // namespace syncq::model
