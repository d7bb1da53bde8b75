#include "sqlite_item_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <iterator>

namespace syncq::db::sqlite {

using syncq::model::ItemId;
using syncq::model::ItemStatus;
using syncq::model::Priority;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kColumns =
    "id,idempotency_key,priority,payload,payload_codec,status,attempts,last_error,"
    "enqueued_at,updated_at,next_attempt_at,reservation_token,reservation_deadline";

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  const int     rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
  if (rc != SQLITE_OK) throw DbError(Translate(db, rc));
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindBlob(sqlite3_stmt* st, int idx, const void* data, std::size_t size) {
  sqlite3_bind_blob(st, idx, data, static_cast<int>(size), SQLITE_TRANSIENT);
}

void BindId(sqlite3_stmt* st, int idx, const ItemId& id) {
  BindBlob(st, idx, id.data(), id.size());
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindI64(st, idx, util::ToUnixMillis(tp));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string();
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

ItemId ColId(sqlite3_stmt* st, int col) {
  ItemId      id{};
  const auto  raw = ColBlob(st, col);
  std::size_t n   = std::min(raw.size(), id.size());
  for (std::size_t i = 0; i < n; ++i) id[i] = static_cast<std::uint8_t>(raw[i]);
  return id;
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(sqlite3_column_int64(st, col));
}

std::string StatusText(ItemStatus status) {
  return std::string(syncq::model::ToString(status));
}

model::ItemRecord ReadRecord(sqlite3_stmt* st) {
  model::ItemRecord r;
  r.id              = ColId(st, 0);
  r.idempotency_key = ColOptText(st, 1);
  r.priority        = static_cast<Priority>(sqlite3_column_int(st, 2));
  r.payload         = ColBlob(st, 3);
  r.payload_codec   = ColText(st, 4);
  r.status          = syncq::model::ParseStatus(ColText(st, 5)).value_or(ItemStatus::kDead);
  r.attempts        = static_cast<std::uint32_t>(sqlite3_column_int64(st, 6));
  r.last_error      = ColOptText(st, 7);
  r.enqueued_at     = ColTime(st, 8);
  r.updated_at      = ColTime(st, 9);
  r.next_attempt_at = ColTime(st, 10);
  r.reservation_token = ColOptText(st, 11);
  if (sqlite3_column_type(st, 12) != SQLITE_NULL) r.reservation_deadline = ColTime(st, 12);
  return r;
}

// Step a SELECT to completion, collecting rows.
Result CollectRows(sqlite3* db, sqlite3_stmt* st, std::vector<model::ItemRecord>& out) {
  for (;;) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
      out.push_back(ReadRecord(st));
      continue;
    }
    return Translate(db, rc);
  }
}

std::optional<model::ItemRecord> SingleRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return ReadRecord(st);
  if (rc != SQLITE_DONE) throw DbError(Translate(db, rc));
  return std::nullopt;
}

} // namespace

SqliteItemStore::SqliteItemStore(std::shared_ptr<SqlitePool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> SqliteItemStore::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire());
}

SqliteTransaction& SqliteItemStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteItemStore::ExplainMiss(Transaction& t, const ItemId& id, const std::string& token) {
  auto row = Get(t, id);
  if (!row) return Result::Err(ErrorCode::NotFound, "item " + util::ToString(id) + " not found");
  if (row->status != ItemStatus::kInFlight) {
    return Result::Err(ErrorCode::Conflict, "item " + util::ToString(id) + " is " + StatusText(row->status) + ", not InFlight");
  }
  if (row->reservation_token != token) {
    return Result::Err(ErrorCode::Conflict, "reservation token mismatch for item " + util::ToString(id));
  }
  return Result::Err(ErrorCode::InternalError, "token-guarded update matched no row");
}

// ------------------------------------------------------------------
// Queue operations
// ------------------------------------------------------------------

Result SqliteItemStore::Insert(Transaction& t, const model::ItemRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO items(") + kColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindId(st.get(), 1, r.id);
  BindOptText(st.get(), 2, r.idempotency_key);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(r.priority));
  BindBlob(st.get(), 4, r.payload.data(), r.payload.size());
  BindText(st.get(), 5, r.payload_codec);
  BindText(st.get(), 6, StatusText(r.status));
  BindI64(st.get(), 7, r.attempts);
  BindOptText(st.get(), 8, r.last_error);
  BindTime(st.get(), 9, r.enqueued_at);
  BindTime(st.get(), 10, r.updated_at);
  BindTime(st.get(), 11, r.next_attempt_at);
  BindOptText(st.get(), 12, r.reservation_token);
  if (r.reservation_deadline) {
    BindTime(st.get(), 13, *r.reservation_deadline);
  } else {
    sqlite3_bind_null(st.get(), 13);
  }

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteItemStore::Reserve(Transaction& t, const ReserveRequest& req, std::vector<model::ItemRecord>& out) {
  auto* db = TX(t).Handle();
  if (req.limit == 0) return Result::Ok();

  std::vector<model::ItemRecord> candidates;
  {
    auto st = Prepare(db, std::string("SELECT ") + kColumns +
                              " FROM items WHERE status='Pending' AND next_attempt_at<=?"
                              " ORDER BY priority DESC, enqueued_at ASC, id ASC LIMIT ?;");
    BindTime(st.get(), 1, req.now);
    BindI64(st.get(), 2, static_cast<std::int64_t>(req.limit));
    if (auto r = CollectRows(db, st.get(), candidates); !r) return r;
  }

  auto update = Prepare(db,
                        "UPDATE items SET status='InFlight', reservation_token=?, reservation_deadline=?,"
                        " attempts=attempts+1, updated_at=? WHERE id=? AND status='Pending';");

  for (auto& r : candidates) {
    sqlite3_reset(update.get());
    sqlite3_clear_bindings(update.get());
    BindText(update.get(), 1, req.token);
    BindTime(update.get(), 2, req.deadline);
    BindTime(update.get(), 3, req.now);
    BindId(update.get(), 4, r.id);

    if (auto res = Translate(db, sqlite3_step(update.get())); !res) return res;
    if (sqlite3_changes(db) != 1) {
      return Result::Err(ErrorCode::InternalError, "reserve lost row " + util::ToString(r.id) + " inside its transaction");
    }

    r.status               = ItemStatus::kInFlight;
    r.reservation_token    = req.token;
    r.reservation_deadline = req.deadline;
    r.attempts += 1;
    r.updated_at = req.now;
  }

  out.insert(out.end(), std::make_move_iterator(candidates.begin()), std::make_move_iterator(candidates.end()));
  return Result::Ok();
}

Result SqliteItemStore::Commit(Transaction& t, const ItemId& id, const std::string& token, util::TimePoint now) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE items SET status='Committed', reservation_token=NULL, reservation_deadline=NULL, updated_at=?"
                    " WHERE id=? AND status='InFlight' AND reservation_token=?;");
  BindTime(st.get(), 1, now);
  BindId(st.get(), 2, id);
  BindText(st.get(), 3, token);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return ExplainMiss(t, id, token);
  return Result::Ok();
}

Result SqliteItemStore::Fail(Transaction& t, const ItemId& id, const std::string& token, const FailUpdate& u) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE items SET status=?, next_attempt_at=?, last_error=COALESCE(?, last_error), attempts=MAX(attempts+?, 0),"
                    " reservation_token=NULL, reservation_deadline=NULL, updated_at=?"
                    " WHERE id=? AND status='InFlight' AND reservation_token=?;");
  BindText(st.get(), 1, StatusText(u.next_status));
  BindTime(st.get(), 2, u.next_attempt_at);
  BindOptText(st.get(), 3, u.last_error);
  BindI64(st.get(), 4, u.attempts_increment);
  BindTime(st.get(), 5, u.now);
  BindId(st.get(), 6, id);
  BindText(st.get(), 7, token);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return ExplainMiss(t, id, token);
  return Result::Ok();
}

Result SqliteItemStore::Reap(Transaction& t, util::TimePoint now, std::vector<ItemId>& reaped) {
  auto* db = TX(t).Handle();

  {
    auto st = Prepare(db, "SELECT id FROM items WHERE status='InFlight' AND reservation_deadline<=? ORDER BY id;");
    BindTime(st.get(), 1, now);
    for (;;) {
      const int rc = sqlite3_step(st.get());
      if (rc == SQLITE_ROW) {
        reaped.push_back(ColId(st.get(), 0));
        continue;
      }
      if (auto r = Translate(db, rc); !r) return r;
      break;
    }
  }
  if (reaped.empty()) return Result::Ok();

  auto st = Prepare(db,
                    "UPDATE items SET status='Pending', next_attempt_at=?, reservation_token=NULL, reservation_deadline=NULL,"
                    " updated_at=? WHERE status='InFlight' AND reservation_deadline<=?;");
  BindTime(st.get(), 1, now);
  BindTime(st.get(), 2, now);
  BindTime(st.get(), 3, now);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteItemStore::MarkDead(Transaction& t, const ItemId& id, const std::string& reason, util::TimePoint now) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE items SET status='Dead', last_error=?, updated_at=? WHERE id=? AND status='Pending';");
  BindText(st.get(), 1, reason);
  BindTime(st.get(), 2, now);
  BindId(st.get(), 3, id);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "no Pending item " + util::ToString(id));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Lookups
// ------------------------------------------------------------------

std::optional<model::ItemRecord> SqliteItemStore::Get(Transaction& t, const ItemId& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kColumns + " FROM items WHERE id=?;");
  BindId(st.get(), 1, id);
  return SingleRow(db, st.get());
}

std::optional<model::ItemRecord> SqliteItemStore::FindLiveByIdempotencyKey(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kColumns +
                             " FROM items WHERE idempotency_key=? AND status IN ('Pending','InFlight') LIMIT 1;");
  BindText(st.get(), 1, key);
  return SingleRow(db, st.get());
}

std::optional<model::ItemRecord> SqliteItemStore::OldestPendingAtOrBelow(Transaction& t, Priority max_priority) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kColumns +
                             " FROM items WHERE status='Pending' AND priority<=?"
                             " ORDER BY enqueued_at ASC, id ASC LIMIT 1;");
  sqlite3_bind_int(st.get(), 1, static_cast<int>(max_priority));
  return SingleRow(db, st.get());
}

Result SqliteItemStore::CountByStatus(Transaction& t, StatusCounts& out) {
  auto* db = TX(t).Handle();

  for (auto status : syncq::model::kAllStatuses) out[status] = 0;

  auto st = Prepare(db, "SELECT status, COUNT(*) FROM items GROUP BY status;");
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);

    auto status = syncq::model::ParseStatus(ColText(st.get(), 0));
    if (!status) return Result::Err(ErrorCode::Corruption, "unknown status in items table: " + ColText(st.get(), 0));
    out[*status] = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 1));
  }
}

Result SqliteItemStore::OldestPendingByPriority(Transaction& t, std::map<Priority, util::TimePoint>& out) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT priority, MIN(enqueued_at) FROM items WHERE status='Pending' GROUP BY priority;");
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    out[static_cast<Priority>(sqlite3_column_int(st.get(), 0))] = ColTime(st.get(), 1);
  }
}

Result SqliteItemStore::IterateDead(Transaction& t, std::size_t limit, std::vector<model::ItemRecord>& out) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kColumns + " FROM items WHERE status='Dead' ORDER BY updated_at ASC, id ASC LIMIT ?;");
  BindI64(st.get(), 1, static_cast<std::int64_t>(limit));
  return CollectRows(db, st.get(), out);
}

// ------------------------------------------------------------------
// Removal
// ------------------------------------------------------------------

Result SqliteItemStore::Purge(Transaction& t, const std::vector<ItemId>& ids) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM items WHERE id=?;");
  for (const auto& id : ids) {
    sqlite3_reset(st.get());
    BindId(st.get(), 1, id);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }
  return Result::Ok();
}

Result SqliteItemStore::PurgeOlderThan(Transaction& t, ItemStatus status, util::TimePoint cutoff, std::size_t limit, std::size_t& purged) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "DELETE FROM items WHERE id IN ("
                    "SELECT id FROM items WHERE status=? AND updated_at<? ORDER BY updated_at ASC LIMIT ?);");
  BindText(st.get(), 1, StatusText(status));
  BindTime(st.get(), 2, cutoff);
  BindI64(st.get(), 3, static_cast<std::int64_t>(limit));

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  purged = static_cast<std::size_t>(sqlite3_changes(db));
  return Result::Ok();
}

} // namespace syncq::db::sqlite
