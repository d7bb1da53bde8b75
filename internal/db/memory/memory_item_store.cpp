#include "memory_item_store.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace syncq::db::memory {

using syncq::model::ItemId;
using syncq::model::ItemStatus;
using syncq::model::Priority;

namespace {

bool HoldsKey(const model::ItemRecord& r, const std::string& key) {
  return r.idempotency_key == key && (r.status == ItemStatus::kPending || r.status == ItemStatus::kInFlight);
}

// reserve order: priority DESC, enqueued_at ASC, id ASC
bool ReserveBefore(const model::ItemRecord* a, const model::ItemRecord* b) {
  if (a->priority != b->priority) return a->priority > b->priority;
  if (a->enqueued_at != b->enqueued_at) return a->enqueued_at < b->enqueued_at;
  return a->id < b->id;
}

} // namespace

MemoryItemStore::MemoryItemStore() = default;

std::unique_ptr<db::Transaction> MemoryItemStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryItemStore::TokenGuard(const State& s, const ItemId& id, const std::string& token) const {
  auto it = s.items.find(id);
  if (it == s.items.end()) return Result::Err(ErrorCode::NotFound, "item " + util::ToString(id) + " not found");

  const auto& r = it->second;
  if (r.status != ItemStatus::kInFlight) {
    return Result::Err(ErrorCode::Conflict,
                       "item " + util::ToString(id) + " is " + std::string(syncq::model::ToString(r.status)) + ", not InFlight");
  }
  if (r.reservation_token != token) {
    return Result::Err(ErrorCode::Conflict, "reservation token mismatch for item " + util::ToString(id));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Queue operations
// ------------------------------------------------------------------

Result MemoryItemStore::Insert(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "duplicate item id");

  if (r.idempotency_key) {
    for (const auto& [_, existing] : s.items) {
      if (HoldsKey(existing, *r.idempotency_key)) {
        return Result::Err(ErrorCode::AlreadyExists, "idempotency key in use");
      }
    }
  }

  s.items.emplace(r.id, r);
  return Result::Ok();
}

Result MemoryItemStore::Reserve(Transaction& t, const ReserveRequest& req, std::vector<model::ItemRecord>& out) {
  auto& s = TX(t).Mutable();
  if (req.limit == 0) return Result::Ok();

  std::vector<model::ItemRecord*> eligible;
  for (auto& [_, r] : s.items) {
    if (r.status == ItemStatus::kPending && r.next_attempt_at <= req.now) eligible.push_back(&r);
  }
  std::sort(eligible.begin(), eligible.end(), ReserveBefore);
  if (eligible.size() > req.limit) eligible.resize(req.limit);

  for (auto* r : eligible) {
    r->status               = ItemStatus::kInFlight;
    r->reservation_token    = req.token;
    r->reservation_deadline = req.deadline;
    r->attempts += 1;
    r->updated_at = req.now;
    out.push_back(*r);
  }
  return Result::Ok();
}

Result MemoryItemStore::Commit(Transaction& t, const ItemId& id, const std::string& token, util::TimePoint now) {
  auto& s = TX(t).Mutable();
  if (auto r = TokenGuard(s, id, token); !r) return r;

  auto& r                = s.items.at(id);
  r.status               = ItemStatus::kCommitted;
  r.reservation_token    = std::nullopt;
  r.reservation_deadline = std::nullopt;
  r.updated_at           = now;
  return Result::Ok();
}

Result MemoryItemStore::Fail(Transaction& t, const ItemId& id, const std::string& token, const FailUpdate& u) {
  auto& s = TX(t).Mutable();
  if (auto r = TokenGuard(s, id, token); !r) return r;

  auto& r           = s.items.at(id);
  r.status          = u.next_status;
  r.next_attempt_at = u.next_attempt_at;
  if (u.last_error) r.last_error = u.last_error;
  const auto attempts = static_cast<std::int64_t>(r.attempts) + u.attempts_increment;
  r.attempts          = static_cast<std::uint32_t>(std::max<std::int64_t>(attempts, 0));
  r.reservation_token    = std::nullopt;
  r.reservation_deadline = std::nullopt;
  r.updated_at           = u.now;
  return Result::Ok();
}

Result MemoryItemStore::Reap(Transaction& t, util::TimePoint now, std::vector<ItemId>& reaped) {
  auto& s = TX(t).Mutable();
  for (auto& [id, r] : s.items) {
    if (r.status != ItemStatus::kInFlight || !r.reservation_deadline || *r.reservation_deadline > now) continue;

    r.status               = ItemStatus::kPending;
    r.next_attempt_at      = now;
    r.reservation_token    = std::nullopt;
    r.reservation_deadline = std::nullopt;
    r.updated_at           = now;
    reaped.push_back(id);
  }
  return Result::Ok();
}

Result MemoryItemStore::MarkDead(Transaction& t, const ItemId& id, const std::string& reason, util::TimePoint now) {
  auto& s  = TX(t).Mutable();
  auto  it = s.items.find(id);
  if (it == s.items.end() || it->second.status != ItemStatus::kPending) {
    return Result::Err(ErrorCode::NotFound, "no Pending item " + util::ToString(id));
  }
  it->second.status     = ItemStatus::kDead;
  it->second.last_error = reason;
  it->second.updated_at = now;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Lookups
// ------------------------------------------------------------------

std::optional<model::ItemRecord> MemoryItemStore::Get(Transaction& t, const ItemId& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ItemRecord> MemoryItemStore::FindLiveByIdempotencyKey(Transaction& t, const std::string& key) {
  for (const auto& [_, r] : TX(t).View().items) {
    if (HoldsKey(r, key)) return r;
  }
  return std::nullopt;
}

std::optional<model::ItemRecord> MemoryItemStore::OldestPendingAtOrBelow(Transaction& t, Priority max_priority) {
  const model::ItemRecord* best = nullptr;
  for (const auto& [_, r] : TX(t).View().items) {
    if (r.status != ItemStatus::kPending || r.priority > max_priority) continue;
    // items is ordered by id, so strict < keeps the lowest id on ties
    if (!best || r.enqueued_at < best->enqueued_at) best = &r;
  }
  if (!best) return std::nullopt;
  return *best;
}

Result MemoryItemStore::CountByStatus(Transaction& t, StatusCounts& out) {
  for (auto status : syncq::model::kAllStatuses) out[status] = 0;
  for (const auto& [_, r] : TX(t).View().items) ++out[r.status];
  return Result::Ok();
}

Result MemoryItemStore::OldestPendingByPriority(Transaction& t, std::map<Priority, util::TimePoint>& out) {
  for (const auto& [_, r] : TX(t).View().items) {
    if (r.status != ItemStatus::kPending) continue;
    auto it = out.find(r.priority);
    if (it == out.end() || r.enqueued_at < it->second) out[r.priority] = r.enqueued_at;
  }
  return Result::Ok();
}

Result MemoryItemStore::IterateDead(Transaction& t, std::size_t limit, std::vector<model::ItemRecord>& out) {
  std::vector<const model::ItemRecord*> dead;
  for (const auto& [_, r] : TX(t).View().items) {
    if (r.status == ItemStatus::kDead) dead.push_back(&r);
  }
  std::stable_sort(dead.begin(), dead.end(), [](const auto* a, const auto* b) { return a->updated_at < b->updated_at; });
  if (dead.size() > limit) dead.resize(limit);
  for (const auto* r : dead) out.push_back(*r);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Removal
// ------------------------------------------------------------------

Result MemoryItemStore::Purge(Transaction& t, const std::vector<ItemId>& ids) {
  auto& s = TX(t).Mutable();
  for (const auto& id : ids) s.items.erase(id);
  return Result::Ok();
}

Result MemoryItemStore::PurgeOlderThan(Transaction& t, ItemStatus status, util::TimePoint cutoff, std::size_t limit, std::size_t& purged) {
  auto& s = TX(t).Mutable();

  std::vector<const model::ItemRecord*> victims;
  for (const auto& [_, r] : s.items) {
    if (r.status == status && r.updated_at < cutoff) victims.push_back(&r);
  }
  std::stable_sort(victims.begin(), victims.end(), [](const auto* a, const auto* b) { return a->updated_at < b->updated_at; });
  if (victims.size() > limit) victims.resize(limit);

  std::vector<ItemId> ids;
  ids.reserve(victims.size());
  for (const auto* r : victims) ids.push_back(r->id);
  for (const auto& id : ids) s.items.erase(id);

  purged = ids.size();
  return Result::Ok();
}

} // namespace syncq::db::memory
