#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace syncq::db::sqlite {

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

// Ordered list of schema migrations for the items table.
const std::vector<Migration>& Migrations();

/*
  Applies every migration newer than the recorded schema version, each in
  its own transaction, and records it in schema_migrations. Safe to run
  from several processes at once: BEGIN IMMEDIATE serializes them and the
  version is re-read inside the transaction.

  Returns the schema version after bootstrap.
*/
int BootstrapSchema(const std::shared_ptr<SqliteDB>& db, std::int64_t now_ms);

} // namespace syncq::db::sqlite
