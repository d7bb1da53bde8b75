#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/item_store.hpp"
#include "internal/db/memory/memory_item_store.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_item_store.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/util/uuid.hpp"

namespace {

using syncq::db::ErrorCode;
using syncq::db::FailUpdate;
using syncq::db::ItemStore;
using syncq::db::ReserveRequest;
using syncq::db::WithTransaction;
using syncq::db::memory::MemoryItemStore;
using syncq::db::model::ItemRecord;
using syncq::model::ItemId;
using syncq::model::ItemStatus;
using syncq::model::Priority;
using syncq::util::Duration;
using syncq::util::TimePoint;

const TimePoint kT0 = syncq::util::FromUnixMillis(1704067200000);

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<ItemStore>()> make_store;
  std::function<bool()>                        supports_restart;
  std::function<void()>                        cleanup;
  bool                                         supports_parallel_transactions = true;
};

ItemRecord MakeRecord(Priority priority, TimePoint enqueued_at, std::optional<std::string> key = std::nullopt) {
  ItemRecord r;
  r.id              = syncq::util::GenerateUUIDv7(enqueued_at);
  r.idempotency_key = std::move(key);
  r.priority        = priority;
  r.status          = ItemStatus::kPending;
  r.payload         = std::string("\x01\x00\xff payload", 11);
  r.payload_codec   = "0:00112233aabbccdd:24";
  r.enqueued_at     = enqueued_at;
  r.updated_at      = enqueued_at;
  r.next_attempt_at = enqueued_at;
  return r;
}

void Insert(ItemStore& store, const ItemRecord& r) {
  WithTransaction(store, [&](syncq::db::Transaction& tx) { assert(store.Insert(tx, r)); });
}

std::vector<ItemRecord> Reserve(ItemStore& store, std::size_t limit, TimePoint now, const std::string& token,
                                Duration ttl = Duration(60000)) {
  return WithTransaction(store, [&](syncq::db::Transaction& tx) {
    std::vector<ItemRecord> out;
    ReserveRequest          req{limit, now, token, now + ttl};
    assert(store.Reserve(tx, req, out));
    return out;
  });
}

std::optional<ItemRecord> Get(ItemStore& store, const ItemId& id) {
  return WithTransaction(store, [&](syncq::db::Transaction& tx) { return store.Get(tx, id); });
}

void Clear(ItemStore& store) {
  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    for (auto status : syncq::model::kAllStatuses) {
      std::size_t purged = 0;
      assert(store.PurgeOlderThan(tx, status, kT0 + Duration(1000000000), 1000000, purged));
    }
  });
}

void VerifyInsertRoundTrip(ItemStore& store) {
  auto r = MakeRecord(Priority::kHigh, kT0, "key-roundtrip");
  Insert(store, r);

  auto read = Get(store, r.id);
  assert(read.has_value());
  assert(read->id == r.id);
  assert(read->idempotency_key == r.idempotency_key);
  assert(read->priority == Priority::kHigh);
  assert(read->status == ItemStatus::kPending);
  assert(read->payload == r.payload);
  assert(read->payload_codec == r.payload_codec);
  assert(read->attempts == 0);
  assert(!read->last_error.has_value());
  assert(read->enqueued_at == kT0);
  assert(!read->reservation_token.has_value());
  assert(!read->reservation_deadline.has_value());

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    auto duplicate = store.Insert(tx, r);
    assert(duplicate.code == ErrorCode::AlreadyExists);
  });

  Clear(store);
}

void VerifyReserveOrderAndEligibility(ItemStore& store) {
  auto low      = MakeRecord(Priority::kLow, kT0);
  auto normal_a = MakeRecord(Priority::kNormal, kT0 + Duration(1));
  auto normal_b = MakeRecord(Priority::kNormal, kT0 + Duration(2));
  auto critical = MakeRecord(Priority::kCritical, kT0 + Duration(3));
  auto later    = MakeRecord(Priority::kCritical, kT0);
  later.next_attempt_at = kT0 + Duration(10000);

  for (const auto& r : {low, normal_b, critical, normal_a, later}) Insert(store, r);

  const auto now   = kT0 + Duration(100);
  const auto batch = Reserve(store, 3, now, "tok-1");
  assert(batch.size() == 3);
  assert(batch[0].id == critical.id);
  assert(batch[1].id == normal_a.id);
  assert(batch[2].id == normal_b.id);
  for (const auto& r : batch) {
    assert(r.status == ItemStatus::kInFlight);
    assert(r.attempts == 1);
    assert(r.reservation_token == std::optional<std::string>("tok-1"));
    assert(r.reservation_deadline == now + Duration(60000));
  }

  const auto rest = Reserve(store, 10, now, "tok-2");
  assert(rest.size() == 1);
  assert(rest[0].id == low.id);

  assert(Reserve(store, 10, kT0 + Duration(10000), "tok-3").size() == 1);

  Clear(store);
}

void VerifyTokenGuardedWrites(ItemStore& store) {
  auto r = MakeRecord(Priority::kNormal, kT0);
  Insert(store, r);
  Reserve(store, 1, kT0, "right");

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    assert(store.Commit(tx, r.id, "wrong", kT0).code == ErrorCode::Conflict);

    FailUpdate update;
    update.next_status     = ItemStatus::kPending;
    update.next_attempt_at = kT0 + Duration(500);
    update.last_error      = "Retryable(503)";
    update.now             = kT0 + Duration(1);
    assert(store.Fail(tx, r.id, "wrong", update).code == ErrorCode::Conflict);
    assert(store.Fail(tx, r.id, "right", update));
  });

  auto read = Get(store, r.id);
  assert(read->status == ItemStatus::kPending);
  assert(read->next_attempt_at == kT0 + Duration(500));
  assert(read->last_error == std::optional<std::string>("Retryable(503)"));
  assert(!read->reservation_token.has_value());
  assert(read->attempts == 1);

  Reserve(store, 1, kT0 + Duration(500), "second");
  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    assert(store.Commit(tx, r.id, "second", kT0 + Duration(600)));
    assert(store.Commit(tx, r.id, "second", kT0 + Duration(600)).code == ErrorCode::Conflict);
    assert(store.Commit(tx, syncq::util::GenerateUUIDv7(kT0), "x", kT0).code == ErrorCode::NotFound);
  });

  read = Get(store, r.id);
  assert(read->status == ItemStatus::kCommitted);
  assert(read->updated_at == kT0 + Duration(600));
  assert(read->attempts == 2);

  Clear(store);
}

void VerifyReapAndMarkDead(ItemStore& store) {
  auto a = MakeRecord(Priority::kNormal, kT0);
  auto b = MakeRecord(Priority::kNormal, kT0);
  auto c = MakeRecord(Priority::kLow, kT0);
  for (const auto& r : {a, b, c}) Insert(store, r);

  Reserve(store, 2, kT0, "tok", Duration(5000));

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    std::vector<ItemId> reaped;
    assert(store.Reap(tx, kT0 + Duration(4999), reaped));
    assert(reaped.empty());
    assert(store.Reap(tx, kT0 + Duration(5000), reaped));
    assert(reaped.size() == 2);

    // only Pending rows can be evicted
    assert(store.MarkDead(tx, c.id, "Overflow", kT0 + Duration(5000)));
    assert(store.MarkDead(tx, c.id, "Overflow", kT0 + Duration(5000)).code == ErrorCode::NotFound);
  });

  auto read = Get(store, a.id);
  assert(read->status == ItemStatus::kPending);
  assert(read->attempts == 1);
  assert(read->next_attempt_at == kT0 + Duration(5000));
  assert(!read->reservation_deadline.has_value());

  read = Get(store, c.id);
  assert(read->status == ItemStatus::kDead);
  assert(read->last_error == std::optional<std::string>("Overflow"));

  Clear(store);
}

void VerifyIdempotencyIndex(ItemStore& store) {
  auto first = MakeRecord(Priority::kNormal, kT0, "order-1");
  Insert(store, first);

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    auto found = store.FindLiveByIdempotencyKey(tx, "order-1");
    assert(found && found->id == first.id);
    assert(!store.FindLiveByIdempotencyKey(tx, "order-2").has_value());
    assert(store.Insert(tx, MakeRecord(Priority::kNormal, kT0, "order-1")).code == ErrorCode::AlreadyExists);
  });

  Reserve(store, 1, kT0, "tok");
  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    assert(store.FindLiveByIdempotencyKey(tx, "order-1").has_value());
    assert(store.Commit(tx, first.id, "tok", kT0));
    assert(!store.FindLiveByIdempotencyKey(tx, "order-1").has_value());
    // a finished item frees its key
    assert(store.Insert(tx, MakeRecord(Priority::kNormal, kT0, "order-1")));
  });

  Clear(store);
}

void VerifyAggregates(ItemStore& store) {
  auto low_old  = MakeRecord(Priority::kLow, kT0);
  auto low_new  = MakeRecord(Priority::kLow, kT0 + Duration(10));
  auto normal   = MakeRecord(Priority::kNormal, kT0 + Duration(5));
  auto high     = MakeRecord(Priority::kHigh, kT0 + Duration(1));
  for (const auto& r : {low_new, normal, low_old, high}) Insert(store, r);

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    auto victim = store.OldestPendingAtOrBelow(tx, Priority::kNormal);
    assert(victim && victim->id == low_old.id);
    assert(store.OldestPendingAtOrBelow(tx, Priority::kLow)->id == low_old.id);

    syncq::db::StatusCounts counts;
    assert(store.CountByStatus(tx, counts));
    assert(counts[ItemStatus::kPending] == 4);
    assert(counts[ItemStatus::kDead] == 0);

    std::map<Priority, TimePoint> oldest;
    assert(store.OldestPendingByPriority(tx, oldest));
    assert(oldest.size() == 3);
    assert(oldest.at(Priority::kLow) == kT0);
    assert(oldest.at(Priority::kNormal) == kT0 + Duration(5));

    assert(store.MarkDead(tx, low_new.id, "Overflow", kT0 + Duration(20)));
    assert(store.MarkDead(tx, low_old.id, "Overflow", kT0 + Duration(30)));

    std::vector<ItemRecord> dead;
    assert(store.IterateDead(tx, 10, dead));
    assert(dead.size() == 2);
    assert(dead[0].id == low_new.id);
    assert(dead[1].id == low_old.id);

    dead.clear();
    assert(store.IterateDead(tx, 1, dead));
    assert(dead.size() == 1);
  });

  Clear(store);
}

void VerifyPurge(ItemStore& store) {
  auto a = MakeRecord(Priority::kNormal, kT0);
  auto b = MakeRecord(Priority::kNormal, kT0);
  for (const auto& r : {a, b}) Insert(store, r);

  WithTransaction(store, [&](syncq::db::Transaction& tx) {
    assert(store.MarkDead(tx, a.id, "Overflow", kT0 + Duration(10)));
    assert(store.MarkDead(tx, b.id, "Overflow", kT0 + Duration(20)));

    std::size_t purged = 0;
    assert(store.PurgeOlderThan(tx, ItemStatus::kDead, kT0 + Duration(15), 10, purged));
    assert(purged == 1);
    assert(!store.Get(tx, a.id).has_value());

    assert(store.Purge(tx, {b.id, syncq::util::GenerateUUIDv7(kT0)}));
    assert(!store.Get(tx, b.id).has_value());
  });

  Clear(store);
}

void VerifyRollbackBehavior(ItemStore& store) {
  auto r = MakeRecord(Priority::kNormal, kT0);
  {
    auto tx = store.Begin();
    assert(store.Insert(*tx, r));
    assert(store.Get(*tx, r.id).has_value());
    tx->Rollback();
    assert(tx->IsFinished());
  }
  assert(!Get(store, r.id).has_value());

  {
    auto tx = store.Begin();
    assert(store.Insert(*tx, r));
    // destroyed without commit
  }
  assert(!Get(store, r.id).has_value());
}

void VerifyConcurrentReservers(ItemStore& store, bool parallel) {
  constexpr int kItems   = 200;
  constexpr int kThreads = 4;
  for (int i = 0; i < kItems; ++i) Insert(store, MakeRecord(Priority::kNormal, kT0));

  std::mutex        mutex;
  std::set<ItemId>  seen;
  std::atomic<bool> duplicate{false};

  auto reserver = [&](int t) {
    for (;;) {
      const auto batch = Reserve(store, 7, kT0, "worker-" + std::to_string(t));
      if (batch.empty()) return;
      std::lock_guard lock(mutex);
      for (const auto& r : batch) {
        if (!seen.insert(r.id).second) duplicate = true;
      }
    }
  };

  if (parallel) {
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) threads.emplace_back(reserver, t);
    for (auto& th : threads) th.join();
  } else {
    reserver(0);
  }

  assert(!duplicate);
  assert(seen.size() == kItems);

  Clear(store);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto r = MakeRecord(Priority::kCritical, kT0, "durable");
  {
    auto store = backend.make_store();
    Insert(*store, r);
    Reserve(*store, 1, kT0, "before-restart", Duration(5000));
  }

  auto store = backend.make_store();
  auto read  = Get(*store, r.id);
  assert(read.has_value());
  assert(read->status == ItemStatus::kInFlight);
  assert(read->payload == r.payload);

  // the crashed reservation comes back through reap
  WithTransaction(*store, [&](syncq::db::Transaction& tx) {
    std::vector<ItemId> reaped;
    assert(store->Reap(tx, kT0 + Duration(5000), reaped));
    assert(reaped.size() == 1);
  });
  assert(Get(*store, r.id)->status == ItemStatus::kPending);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_store                     = []() { return std::make_shared<MemoryItemStore>(); },
      .supports_restart               = []() { return false; },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  const auto dir = std::filesystem::temp_directory_path() / "syncq_item_store_parity";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path = (dir / "queue.db").string();

  auto make_store = [path]() -> std::shared_ptr<ItemStore> {
    auto pool = std::make_shared<syncq::db::sqlite::SqlitePool>(path, syncq::db::sqlite::SqliteOptions{}, 4, std::chrono::milliseconds(10000));
    const int version = syncq::db::sqlite::BootstrapSchema(pool->Acquire(), syncq::util::ToUnixMillis(kT0));
    assert(version == syncq::db::sqlite::Migrations().back().version);
    return std::make_shared<syncq::db::sqlite::SqliteItemStore>(pool);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_store                     = make_store,
      .supports_restart               = []() { return true; },
      .cleanup                        = [dir]() { std::filesystem::remove_all(dir); },
      .supports_parallel_transactions = true,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  VerifyInsertRoundTrip(*store);
  VerifyReserveOrderAndEligibility(*store);
  VerifyTokenGuardedWrites(*store);
  VerifyReapAndMarkDead(*store);
  VerifyIdempotencyIndex(*store);
  VerifyAggregates(*store);
  VerifyPurge(*store);
  VerifyRollbackBehavior(*store);
  VerifyConcurrentReservers(*store, backend.supports_parallel_transactions);
  store.reset();

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "syncq_integration_item_store_parity: pass\n";
  return 0;
}
