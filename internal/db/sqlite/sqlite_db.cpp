#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"

namespace syncq::db::sqlite {

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, msg);
      }
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

SqliteDB::SqliteDB(std::string path, const SqliteOptions& options) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(std::move(result));
  }

  // extended codes let Translate tell unique violations apart
  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(options);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (err) {
      result.message = err;
      sqlite3_free(err);
    }
    throw DbError(std::move(result));
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) throw DbError(Translate(db_, rc));
  return stmt;
}

void SqliteDB::ApplyKey(const std::string& key_hex) {
  // must run before anything touches the file
  Exec("PRAGMA key = \"x'" + key_hex + "'\";");

  sqlite3_stmt* st = Prepare("PRAGMA cipher_version;");
  const bool    sqlcipher = sqlite3_step(st) == SQLITE_ROW;
  sqlite3_finalize(st);

  if (!sqlcipher) {
    SYNCQ_LOG_WARN("store key configured but linked sqlite has no cipher support; database file is not encrypted",
                   {observability::StringField("path", path_)});
  }
}

void SqliteDB::Configure(const SqliteOptions& options) {
  if (!options.sqlcipher_key_hex.empty()) {
    ApplyKey(options.sqlcipher_key_hex);
  }

  // wait for locks instead of failing immediately; bounds every transaction start
  if (sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout_ms)) != SQLITE_OK) {
    throw DbError(Translate(db_, SQLITE_ERROR));
  }

  if (path_ != ":memory:") {
    // WAL lets readers proceed while a writer holds the lock
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec(options.synchronous_full ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-8000;"); // ~8MB (negative means KB)
}

} // namespace syncq::db::sqlite
