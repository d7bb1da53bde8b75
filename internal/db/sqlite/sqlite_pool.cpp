#include "sqlite_pool.hpp"

namespace syncq::db::sqlite {

SqlitePool::SqlitePool(std::string path, SqliteOptions options, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : path_(std::move(path)),
      options_(std::move(options)),
      max_connections_(max_connections == 0 || path_ == ":memory:" ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  if (!ready) {
    throw DbError(Result::Err(ErrorCode::Busy, "connection pool exhausted after " + std::to_string(acquire_timeout_.count()) + "ms"));
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(new SqliteDB(path_, options_));
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace syncq::db::sqlite
