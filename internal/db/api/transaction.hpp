#pragma once

#include "internal/db/api/result.hpp"

namespace usedgear::db {

enum class TxMode {
  kRead,  // snapshot load: no writes, never publishes
  kWrite, // snapshot save: takes the write lock up front
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Writes through a kRead transaction fail with ConstraintViolation

  SQLite: BEGIN DEFERRED (read) / BEGIN IMMEDIATE (write)
  Memory: copy of the committed records, published on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool   IsCommitted() const = 0;
  virtual TxMode Mode() const = 0;
};

inline Result RequireWritable(const Transaction& tx) {
  if (tx.Mode() == TxMode::kRead) {
    return Result::Err(ErrorCode::ConstraintViolation, "write inside a read transaction");
  }
  return Result::Ok();
}

} // namespace usedgear::db
