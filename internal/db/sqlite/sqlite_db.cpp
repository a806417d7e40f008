#include "sqlite_db.hpp"

#include <stdexcept>

namespace usedgear::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = "cannot open market store " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg + " (" + path_ + ")");
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) Exec(sql);
    Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = Prepare("SELECT COALESCE(MAX(version), 0) FROM market_schema_migrations;");
  int           rc   = sqlite3_step(stmt);
  int           version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) ThrowIf(rc, db_, "read schema version");
  return version;
}

void SqliteDB::Configure(bool wal_mode) {
  // snapshot loads keep reading while a save holds the write lock
  Exec(wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  Exec("PRAGMA synchronous=NORMAL;");

  // attribute rows cascade with their record
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace usedgear::db::sqlite
