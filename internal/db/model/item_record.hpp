#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/item.hpp"
#include "internal/util/time.hpp"

namespace syncq::db::model {

/*
  Persistent queue row; one per item.

  - payload is the codec output (version byte + nonce + ciphertext);
    plaintext is never stored.
  - reservation_token and reservation_deadline are both set exactly
    when status is InFlight.
*/

struct ItemRecord {
  syncq::model::ItemId       id{};
  std::optional<std::string> idempotency_key;

  syncq::model::Priority   priority = syncq::model::Priority::kNormal;
  syncq::model::ItemStatus status   = syncq::model::ItemStatus::kPending;

  std::string payload;
  std::string payload_codec;

  std::uint32_t              attempts = 0;
  std::optional<std::string> last_error;

  util::TimePoint enqueued_at{};
  util::TimePoint updated_at{};
  util::TimePoint next_attempt_at{};

  std::optional<std::string>     reservation_token;
  std::optional<util::TimePoint> reservation_deadline;
};

inline syncq::model::ItemView ToView(const ItemRecord& r) {
  syncq::model::ItemView v;
  v.id                   = r.id;
  v.idempotency_key      = r.idempotency_key;
  v.priority             = r.priority;
  v.status               = r.status;
  v.attempts             = r.attempts;
  v.last_error           = r.last_error;
  v.payload_codec        = r.payload_codec;
  v.enqueued_at          = r.enqueued_at;
  v.updated_at           = r.updated_at;
  v.next_attempt_at      = r.next_attempt_at;
  v.reservation_deadline = r.reservation_deadline;
  return v;
}

} // namespace syncq::db::model
