#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/item_store.hpp"

namespace syncq::db::memory {

class MemoryTransaction;

/*
  ItemStore kept in process memory.

  Same contract as the SQLite store, without durability. A transaction
  holds the writer lock from Begin() until it is destroyed, which gives
  the same serialization as BEGIN IMMEDIATE.
*/
class MemoryItemStore final : public db::ItemStore {
 public:
  MemoryItemStore();

  std::unique_ptr<Transaction> Begin() override;

  Result Insert(Transaction&, const model::ItemRecord&) override;
  Result Reserve(Transaction&, const ReserveRequest&, std::vector<model::ItemRecord>& out) override;
  Result Commit(Transaction&, const syncq::model::ItemId&, const std::string& token, util::TimePoint now) override;
  Result Fail(Transaction&, const syncq::model::ItemId&, const std::string& token, const FailUpdate&) override;
  Result Reap(Transaction&, util::TimePoint now, std::vector<syncq::model::ItemId>& reaped) override;
  Result MarkDead(Transaction&, const syncq::model::ItemId&, const std::string& reason, util::TimePoint now) override;

  std::optional<model::ItemRecord> Get(Transaction&, const syncq::model::ItemId&) override;
  std::optional<model::ItemRecord> FindLiveByIdempotencyKey(Transaction&, const std::string& key) override;
  std::optional<model::ItemRecord> OldestPendingAtOrBelow(Transaction&, syncq::model::Priority max_priority) override;

  Result CountByStatus(Transaction&, StatusCounts& out) override;
  Result OldestPendingByPriority(Transaction&, std::map<syncq::model::Priority, util::TimePoint>& out) override;
  Result IterateDead(Transaction&, std::size_t limit, std::vector<model::ItemRecord>& out) override;

  Result Purge(Transaction&, const std::vector<syncq::model::ItemId>& ids) override;
  Result PurgeOlderThan(Transaction&, syncq::model::ItemStatus status, util::TimePoint cutoff, std::size_t limit,
                        std::size_t& purged) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<syncq::model::ItemId, model::ItemRecord> items;
  };

  Result TokenGuard(const State& s, const syncq::model::ItemId& id, const std::string& token) const;

  std::mutex writer_mutex_; // held by a live transaction
  std::mutex state_mutex_;  // guards committed_ during snapshot and publish
  State      committed_;
};

} // namespace syncq::db::memory
