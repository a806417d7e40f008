#include "market_tables_from_config.hpp"

#include <stdexcept>
#include <string>

namespace usedgear::config {

using usedgear::runtime::config::MarketConfig;

namespace {

void RequireProbability(double value, const std::string& what) {
  if (value < 0.0 || value > 1.0) {
    throw std::invalid_argument(what + " must be within [0, 1]");
  }
}

void RequireNonNegative(double value, const std::string& what) {
  if (value < 0.0) {
    throw std::invalid_argument(what + " must not be negative");
  }
}

std::size_t TierSlot(std::uint32_t tier, std::size_t count, const std::string& what) {
  if (tier < 1 || tier > count) {
    throw std::invalid_argument(what + " tier " + std::to_string(tier) + " is out of range");
  }
  return tier - 1;
}

void ApplySearchOverride(const usedgear::runtime::config::SearchTierOverride& o, market::SearchTierSpec& spec) {
  const std::string what = "search tier " + spec.name;
  if (o.success_chance() != 0.0) {
    RequireProbability(o.success_chance(), what + " success_chance");
    spec.success_chance = o.success_chance();
  }
  if (o.min_months() != 0) spec.min_months = o.min_months();
  if (o.max_months() != 0) spec.max_months = o.max_months();
  if (spec.min_months > spec.max_months) {
    throw std::invalid_argument(what + " min_months exceeds max_months");
  }
  if (o.retainer_flat() != 0.0) {
    RequireNonNegative(o.retainer_flat(), what + " retainer_flat");
    spec.retainer_flat = o.retainer_flat();
  }
  if (o.retainer_percent() != 0.0) {
    RequireProbability(o.retainer_percent(), what + " retainer_percent");
    spec.retainer_percent = o.retainer_percent();
  }
  if (o.find_count() != 0) spec.find_count = o.find_count();
}

void ApplySaleOverride(const usedgear::runtime::config::SaleTierOverride& o, market::SaleTierSpec& spec) {
  const std::string what = "sale tier " + spec.name;
  if (o.fee_flat() != 0.0) {
    RequireNonNegative(o.fee_flat(), what + " fee_flat");
    spec.fee_flat = o.fee_flat();
  }
  if (o.fee_percent() != 0.0) {
    RequireProbability(o.fee_percent(), what + " fee_percent");
    spec.fee_percent = o.fee_percent();
  }
  if (o.offer_cycle_hours() != 0) spec.offer_cycle_hours = o.offer_cycle_hours();
  if (o.success_chance() != 0.0) {
    RequireProbability(o.success_chance(), what + " success_chance");
    spec.success_chance = o.success_chance();
  }
  if (o.has_return_range()) {
    if (o.return_range().min() <= 0.0 || o.return_range().min() > o.return_range().max()) {
      throw std::invalid_argument(what + " return_range must satisfy 0 < min <= max");
    }
    spec.return_range = {o.return_range().min(), o.return_range().max()};
  }
  if (o.listing_lifetime_hours() != 0) spec.listing_lifetime_hours = o.listing_lifetime_hours();
}

void ApplyInspectionOverride(const usedgear::runtime::config::InspectionTierOverride& o,
                             market::InspectionTierSpec&                              spec) {
  const std::string what = "inspection tier " + spec.name;
  if (o.fee_flat() != 0.0) {
    RequireNonNegative(o.fee_flat(), what + " fee_flat");
    spec.fee_flat = o.fee_flat();
  }
  if (o.fee_percent() != 0.0) {
    RequireProbability(o.fee_percent(), what + " fee_percent");
    spec.fee_percent = o.fee_percent();
  }
  if (o.fee_cap() != 0.0) {
    RequireNonNegative(o.fee_cap(), what + " fee_cap");
    spec.fee_cap = o.fee_cap();
  }
  if (o.duration_hours() != 0) spec.duration_hours = o.duration_hours();
}

} // namespace

market::MarketTables MarketTablesFromConfig(const MarketConfig& config) {
  auto tables = market::MarketTables::Defaults();

  if (config.max_active_searches() != 0) tables.max_active_searches = config.max_active_searches();
  if (config.found_listing_window_hours() != 0) tables.found_listing_window_hours = config.found_listing_window_hours();
  if (config.sale_offer_window_hours() != 0) tables.sale_offer_window_hours = config.sale_offer_window_hours();
  if (config.tombstone_retention_periods() != 0) {
    tables.tombstone_retention_periods = config.tombstone_retention_periods();
  }
  if (config.commission_percent() != 0.0) {
    if (config.commission_percent() < 0.0 || config.commission_percent() >= 1.0) {
      throw std::invalid_argument("commission_percent must be within [0, 1)");
    }
    tables.commission_percent = config.commission_percent();
  }
  tables.situation_modifiers = !config.disable_situation_modifiers();

  for (const auto& o : config.search_tiers()) {
    ApplySearchOverride(o, tables.search[TierSlot(o.tier(), model::kAgentTierCount, "search")]);
  }
  for (const auto& o : config.sale_tiers()) {
    ApplySaleOverride(o, tables.sale[TierSlot(o.tier(), model::kAgentTierCount, "sale")]);
  }
  for (const auto& o : config.inspection_tiers()) {
    ApplyInspectionOverride(o, tables.inspection[TierSlot(o.tier(), model::kInspectionTierCount, "inspection")]);
  }

  return tables;
}

} // namespace usedgear::config
