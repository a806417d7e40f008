#include "tier_tables.hpp"

#include <algorithm>
#include <cmath>

namespace usedgear::market {

using model::ConditionField;
using model::Personality;

const QualityTierSpec& MarketTables::Quality(model::QualityTier tier) const {
  return quality[model::Slot(tier)];
}

const GenerationSpec& MarketTables::Generation(model::GenerationClass generation) const {
  return generations[model::Slot(generation)];
}

const SearchTierSpec& MarketTables::Search(model::AgentTier tier) const {
  return search[model::Slot(tier)];
}

const SaleTierSpec& MarketTables::Sale(model::AgentTier tier) const {
  return sale[model::Slot(tier)];
}

const InspectionTierSpec& MarketTables::Inspection(model::InspectionTier tier) const {
  return inspection[model::Slot(tier)];
}

MarketTables MarketTables::Defaults() {
  MarketTables tables;

  tables.quality = {{
      {"Poor", {0.22, 0.38}, {0.55, 0.80}, {0.60, 0.85}, 0.15},
      {"Any", {0.30, 0.50}, {0.35, 0.60}, {0.40, 0.65}, 0.08},
      {"Fair", {0.50, 0.68}, {0.18, 0.35}, {0.22, 0.40}, 0.00},
      {"Good", {0.68, 0.80}, {0.06, 0.18}, {0.08, 0.22}, -0.08},
      {"Excellent", {0.80, 0.94}, {0.00, 0.06}, {0.00, 0.08}, -0.15},
  }};

  tables.generations = {{
      {"Recent", {1, 3}, {100, 800}},
      {"Mid-age", {4, 7}, {200, 1200}},
      {"Old", {8, 15}, {500, 2500}},
  }};

  tables.search = {{
      {"Local", {0.20, 0.50, 0.30}, 1.3, 0.25, 1, 1, 500.0, 0.000, 1},
      {"Regional", {0.40, 0.40, 0.20}, 1.0, 0.55, 1, 2, 1000.0, 0.005, 2},
      {"National", {0.55, 0.35, 0.10}, 0.7, 0.80, 2, 4, 2000.0, 0.008, 3},
  }};

  tables.sale = {{
      {"Local", 50.0, 0.00, 12, 0.60, {0.60, 0.75}, 72},
      {"Regional", 250.0, 0.01, 24, 0.75, {0.75, 0.90}, 120},
      {"National", 750.0, 0.02, 36, 0.85, {0.88, 1.00}, 168},
  }};

  tables.inspection = {{
      {"Quick", 1000.0, 0.02, 2500.0, 2, {ConditionField::kOverallRating}},
      {"Standard",
       2000.0,
       0.03,
       5000.0,
       6,
       {ConditionField::kOverallRating, ConditionField::kEngineReliability, ConditionField::kHydraulicReliability,
        ConditionField::kElectricalReliability}},
      {"Comprehensive",
       4000.0,
       0.05,
       10000.0,
       12,
       {ConditionField::kOverallRating, ConditionField::kEngineReliability, ConditionField::kHydraulicReliability,
        ConditionField::kElectricalReliability, ConditionField::kReliabilityCeiling, ConditionField::kQualityHint}},
  }};

  tables.personalities = {{
      {Personality::kDesperate, 0.00, 0.75, 0.15, 0.05},
      {Personality::kMotivated, 0.20, 0.82, 0.08, 0.15},
      {Personality::kReasonable, 0.40, 0.88, 0.00, 0.35},
      {Personality::kFirm, 0.60, 0.92, -0.05, 0.60},
      {Personality::kImmovable, 0.80, 0.98, -0.15, 0.90},
  }};

  return tables;
}

double CreditFeeModifier(std::uint32_t score) {
  if (score >= 750) return -0.15;
  if (score >= 700) return -0.08;
  if (score >= 650) return 0.00;
  if (score >= 600) return 0.10;
  return 0.20;
}

double SearchRetainer(const SearchTierSpec& tier, double base_price, double credit_modifier) {
  const double base = tier.retainer_flat + base_price * tier.retainer_percent;
  return std::floor(base * (1.0 + credit_modifier));
}

double SaleAgentFee(const SaleTierSpec& tier, double vanilla_value) {
  return std::floor(tier.fee_flat + vanilla_value * tier.fee_percent);
}

double InspectionFee(const InspectionTierSpec& tier, double asking_price) {
  return std::floor(std::min(tier.fee_cap, tier.fee_flat + asking_price * tier.fee_percent));
}

} // namespace usedgear::market
