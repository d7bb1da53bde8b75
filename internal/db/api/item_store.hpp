#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/item_record.hpp"

namespace syncq::db {

/*
  ItemStore: durable rows of the queue.

  CRITICAL GUARANTEES:

  - All reads and writes take a Transaction from Begin()
  - Reads inside a transaction see its writes
  - A token-guarded write (Commit, Fail) changes nothing unless the row
    is InFlight with exactly that token; the mismatch reports Conflict
  - Reserve ordering is (priority DESC, enqueued_at ASC, id ASC)
  - Expected outcomes come back as Result; Begin(), Commit() and the
    optional-returning lookups throw DbError when the backend itself
    fails (busy past its timeout, I/O error, corruption)

  The store does not enforce the item state machine; SyncQueue does.
*/

struct ReserveRequest {
  std::size_t     limit = 0;
  util::TimePoint now{};
  std::string     token;
  util::TimePoint deadline{};
};

struct FailUpdate {
  syncq::model::ItemStatus   next_status = syncq::model::ItemStatus::kPending;
  util::TimePoint            next_attempt_at{};
  std::optional<std::string> last_error;
  std::int32_t               attempts_increment = 0; // attempts never drop below 0
  util::TimePoint            now{};
};

using StatusCounts = std::map<syncq::model::ItemStatus, std::uint64_t>;

class ItemStore {
 public:
  virtual ~ItemStore() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Queue operations
  // ---------------------------------------------------------------------

  // AlreadyExists when the id exists or the idempotency key is held by
  // a Pending/InFlight row
  virtual Result Insert(Transaction&, const model::ItemRecord&) = 0;

  virtual Result Reserve(Transaction&, const ReserveRequest&, std::vector<model::ItemRecord>& out) = 0;

  virtual Result Commit(Transaction&, const syncq::model::ItemId&, const std::string& token, util::TimePoint now) = 0;

  virtual Result Fail(Transaction&, const syncq::model::ItemId&, const std::string& token, const FailUpdate&) = 0;

  // InFlight rows whose deadline passed go back to Pending; ids are returned
  virtual Result Reap(Transaction&, util::TimePoint now, std::vector<syncq::model::ItemId>& reaped) = 0;

  // Pending -> Dead for overflow eviction; NotFound unless the row is Pending
  virtual Result MarkDead(Transaction&, const syncq::model::ItemId&, const std::string& reason, util::TimePoint now) = 0;

  // ---------------------------------------------------------------------
  // Lookups
  // ---------------------------------------------------------------------

  virtual std::optional<model::ItemRecord> Get(Transaction&, const syncq::model::ItemId&) = 0;

  virtual std::optional<model::ItemRecord> FindLiveByIdempotencyKey(Transaction&, const std::string& key) = 0;

  // oldest Pending row (enqueued_at, id) with priority <= max_priority
  virtual std::optional<model::ItemRecord> OldestPendingAtOrBelow(Transaction&, syncq::model::Priority max_priority) = 0;

  virtual Result CountByStatus(Transaction&, StatusCounts& out) = 0;

  virtual Result OldestPendingByPriority(Transaction&, std::map<syncq::model::Priority, util::TimePoint>& out) = 0;

  // oldest first by updated_at
  virtual Result IterateDead(Transaction&, std::size_t limit, std::vector<model::ItemRecord>& out) = 0;

  // ---------------------------------------------------------------------
  // Removal
  // ---------------------------------------------------------------------

  virtual Result Purge(Transaction&, const std::vector<syncq::model::ItemId>& ids) = 0;

  // deletes up to limit rows in status whose updated_at < cutoff
  virtual Result PurgeOlderThan(Transaction&, syncq::model::ItemStatus status, util::TimePoint cutoff, std::size_t limit,
                                std::size_t& purged) = 0;
};

/*
  Runs f inside one transaction and commits when it returns. An exception
  from f rolls back through the transaction's destructor.
*/
template <typename F>
auto WithTransaction(ItemStore& store, F&& f) {
  auto tx = store.Begin();
  if constexpr (std::is_void_v<std::invoke_result_t<F&, Transaction&>>) {
    f(*tx);
    tx->Commit();
  } else {
    auto out = f(*tx);
    tx->Commit();
    return out;
  }
}

} // namespace syncq::db
