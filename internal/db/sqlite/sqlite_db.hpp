#pragma once

#include <sqlite3.h>

#include <string>
#include <vector>

namespace usedgear::db::sqlite {

/*
  Owns the sqlite3 handle behind the market snapshot store.

  Opening configures the connection for one writer (the snapshot save)
  alongside readers. Statements prepared through Prepare() must be
  finalized by the caller.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  sqlite3_stmt* Prepare(const std::string& sql);

  // Runs the statements in one write transaction; nothing is kept if any fails.
  void ApplySchema(const std::vector<std::string>& statements);

  // Highest version in market_schema_migrations, 0 when none is recorded.
  int SchemaVersion();

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace usedgear::db::sqlite
