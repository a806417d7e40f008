#pragma once

#include "config/config.pb.h"
#include "internal/market/tier_tables.hpp"

namespace usedgear::config {

// Shipped balance with the config's overrides applied. Zero-valued fields
// keep the default. Throws std::invalid_argument on out-of-range values.
market::MarketTables MarketTablesFromConfig(const usedgear::runtime::config::MarketConfig& config);

} // namespace usedgear::config
