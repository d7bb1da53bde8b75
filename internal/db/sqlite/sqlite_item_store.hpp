#pragma once

#include <memory>

#include "internal/db/api/item_store.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace syncq::db::sqlite {

/*
  ItemStore over SQLite.

  Every transaction runs on its own pooled connection; BEGIN IMMEDIATE
  serializes writers across connections and processes, so Reserve can
  select-then-update without handing one row to two callers.
*/
class SqliteItemStore final : public db::ItemStore {
 public:
  explicit SqliteItemStore(std::shared_ptr<SqlitePool> pool);

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

  const std::shared_ptr<SqlitePool>& Pool() const {
    return pool_;
  }

 private:
  static SqliteTransaction& TX(Transaction& t);

  // token-guarded write touched nothing: say why
  Result ExplainMiss(Transaction& t, const syncq::model::ItemId& id, const std::string& token);

  std::shared_ptr<SqlitePool> pool_;
};

} // namespace syncq::db::sqlite
