#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_item_store.hpp"

namespace syncq::db::memory {

/*
  Transaction = writer lock + snapshot copy; Commit publishes the copy.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryItemStore& store);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

  MemoryItemStore::State& Mutable() {
    return working_;
  }
  const MemoryItemStore::State& View() const {
    return working_;
  }

 private:
  MemoryItemStore&             store_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryItemStore::State       working_;
  bool                         finished_ = false;
};

} // namespace syncq::db::memory
