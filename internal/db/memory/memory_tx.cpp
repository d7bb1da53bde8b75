#include "memory_tx.hpp"

namespace syncq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryItemStore& store) : store_(store), writer_lock_(store.writer_mutex_) {
  std::scoped_lock lock(store_.state_mutex_);
  working_ = store_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(store_.state_mutex_);
    store_.committed_ = std::move(working_);
  }
  finished_ = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  working_  = {};
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace syncq::db::memory
