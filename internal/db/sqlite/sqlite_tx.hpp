#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace usedgear::db::sqlite {

/*
  SQLite transaction wrapper.

  Snapshot saves begin IMMEDIATE so a second writer fails at Begin()
  instead of halfway through replacing the records. Loads begin DEFERRED
  and only take a shared lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB> db_;
  TxMode mode_;
  bool committed_ = false;
  bool finished_  = false;
};

}
