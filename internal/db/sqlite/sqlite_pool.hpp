#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace syncq::db::sqlite {

/*
  SqlitePool

  Bounded set of connections to one database file.

  - Connections are opened lazily up to max_connections and reused.
  - Acquire() waits up to acquire_timeout for a free connection and then
    throws DbError(Busy); callers see pool backpressure as a transient
    store error.
  - ":memory:" databases are private per connection, so the pool is
    forced down to one connection for them.

  Lifetime:
    SqliteItemStore owns shared_ptr<SqlitePool>
    Transaction holds shared_ptr<SqliteDB>; dropping it returns the
    connection to the pool
*/
class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, SqliteOptions options, std::size_t max_connections, std::chrono::milliseconds acquire_timeout);

  std::shared_ptr<SqliteDB> Acquire();

  // run f(SqliteDB&) on a pooled connection
  template <typename F>
  auto WithConnection(F&& f) {
    auto conn = Acquire();
    return f(*conn);
  }

  // run f(SqliteTransaction&) inside BEGIN IMMEDIATE ... COMMIT
  template <typename F>
  auto WithTransaction(F&& f) {
    SqliteTransaction tx(Acquire());
    if constexpr (std::is_void_v<std::invoke_result_t<F&, SqliteTransaction&>>) {
      f(tx);
      tx.Commit();
    } else {
      auto out = f(tx);
      tx.Commit();
      return out;
    }
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string               path_;
  SqliteOptions             options_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace syncq::db::sqlite
