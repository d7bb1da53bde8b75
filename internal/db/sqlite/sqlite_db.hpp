#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace syncq::db::sqlite {

struct SqliteOptions {
  std::uint64_t busy_timeout_ms   = 5000;
  bool          synchronous_full  = false;
  std::string   sqlcipher_key_hex;
};

// Map a sqlite return code to a portable Result.
Result Translate(sqlite3* db, int rc);

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, const SqliteOptions& options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, migrations, BEGIN/COMMIT); throws DbError
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize); throws DbError
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(const SqliteOptions& options);
  void ApplyKey(const std::string& key_hex);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace syncq::db::sqlite
