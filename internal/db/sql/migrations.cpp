#include "migrations.hpp"

namespace usedgear::db::sql {

const std::vector<std::string>& MarketRecordSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS market_record (kind TEXT NOT NULL, id TEXT NOT NULL, PRIMARY KEY (kind, id));",
      "CREATE TABLE IF NOT EXISTS market_record_attr (kind TEXT NOT NULL, id TEXT NOT NULL, name TEXT NOT NULL, value TEXT NOT NULL, "
      "PRIMARY KEY (kind, id, name), FOREIGN KEY (kind, id) REFERENCES market_record(kind, id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS market_schema_migrations (version INTEGER PRIMARY KEY);",
      "INSERT OR IGNORE INTO market_schema_migrations(version) VALUES (1);"};
  return kSchema;
}

} // namespace usedgear::db::sql
