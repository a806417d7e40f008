#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace usedgear::db::sqlite {

/*
  Flat records over two tables:
    market_record(kind, id)
    market_record_attr(kind, id, name, value)
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result PutRecord(Transaction&, const model::FlatRecord&) override;
  std::optional<model::FlatRecord> GetRecord(Transaction&, const std::string& kind, const std::string& id) override;
  std::vector<model::FlatRecord> ListRecords(Transaction&, const std::string& kind) override;
  Result DeleteRecord(Transaction&, const std::string& kind, const std::string& id) override;
  Result ClearAll(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result ExecBound(sqlite3* db, const char* sql, const std::string& kind, const std::string& id);
};

}
