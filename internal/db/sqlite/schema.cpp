#include "schema.hpp"

#include "internal/observability/logging.hpp"
#include "sqlite_tx.hpp"

namespace syncq::db::sqlite {

namespace {

int CurrentVersion(SqliteDB& db) {
  sqlite3_stmt* st      = db.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
  int           version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void RecordVersion(SqliteDB& db, int version, std::int64_t now_ms) {
  sqlite3_stmt* st = db.Prepare("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
  sqlite3_bind_int(st, 1, version);
  sqlite3_bind_int64(st, 2, now_ms);
  const int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) throw DbError(Translate(db.Handle(), rc));
}

} // namespace

const std::vector<Migration>& Migrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS items ("
        " id BLOB PRIMARY KEY,"
        " idempotency_key TEXT,"
        " priority INTEGER NOT NULL,"
        " payload BLOB NOT NULL,"
        " payload_codec TEXT NOT NULL,"
        " status TEXT NOT NULL CHECK (status IN ('Pending','InFlight','Committed','Dead')),"
        " attempts INTEGER NOT NULL DEFAULT 0 CHECK (attempts >= 0),"
        " last_error TEXT,"
        " enqueued_at INTEGER NOT NULL,"
        " updated_at INTEGER NOT NULL,"
        " next_attempt_at INTEGER NOT NULL,"
        " reservation_token TEXT,"
        " reservation_deadline INTEGER,"
        " CHECK ((status = 'InFlight') = (reservation_token IS NOT NULL AND reservation_deadline IS NOT NULL))"
        ");",
        "CREATE INDEX IF NOT EXISTS items_status_priority_next_attempt ON items(status, priority, next_attempt_at);",
        "CREATE UNIQUE INDEX IF NOT EXISTS items_live_idempotency_key ON items(idempotency_key)"
        " WHERE idempotency_key IS NOT NULL AND status IN ('Pending','InFlight');"}},
      {2,
       {// retention sweeps and dead-letter listing scan by status and age
        "CREATE INDEX IF NOT EXISTS items_status_updated_at ON items(status, updated_at);"}},
  };
  return kMigrations;
}

int BootstrapSchema(const std::shared_ptr<SqliteDB>& conn, std::int64_t now_ms) {
  auto& db = *conn;
  db.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  int version = CurrentVersion(db);
  for (const auto& migration : Migrations()) {
    if (migration.version <= version) continue;

    SqliteTransaction tx(conn);
    if (CurrentVersion(db) >= migration.version) {
      // another process got here first
      tx.Rollback();
      continue;
    }
    for (const auto& sql : migration.statements) {
      db.Exec(sql);
    }
    RecordVersion(db, migration.version, now_ms);
    tx.Commit();

    SYNCQ_LOG_INFO("applied schema migration", {observability::IntField("version", migration.version)});
  }

  version = CurrentVersion(db);
  return version;
}

} // namespace syncq::db::sqlite
