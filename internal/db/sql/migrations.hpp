#pragma once

#include <string>
#include <vector>

namespace usedgear::db::sql {

// Version recorded in market_schema_migrations once the statements below have run.
inline constexpr int kMarketSchemaVersion = 1;

// Schema for the flat market record store, oldest statement first.
// Every statement is idempotent so the list can be replayed on each open.
const std::vector<std::string>& MarketRecordSchema();

} // namespace usedgear::db::sql
