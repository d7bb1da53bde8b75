#pragma once

namespace syncq::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions are serialized

  SQLite: BEGIN IMMEDIATE on a pooled connection
  Memory: writer lock + snapshot copy
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace syncq::db
