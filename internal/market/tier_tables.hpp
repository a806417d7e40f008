#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/listing.hpp"
#include "internal/model/negotiation.hpp"
#include "internal/model/tier.hpp"

namespace usedgear::market {

struct Range {
  double min = 0.0;
  double max = 0.0;
};

struct QualityTierSpec {
  std::string name;
  Range       price_multiplier;
  Range       damage;
  Range       wear;
  double      search_success_modifier = 0.0;
};

struct GenerationSpec {
  std::string name;
  Range       age_years;
  Range       hours_per_year;
};

struct SearchTierSpec {
  std::string           name;
  std::array<double, 3> generation_weights{}; // recent, mid-age, old
  double                condition_scale  = 1.0;
  double                success_chance   = 0.0;
  std::uint32_t         min_months       = 1;
  std::uint32_t         max_months       = 1;
  double                retainer_flat    = 0.0;
  double                retainer_percent = 0.0;
  std::uint32_t         find_count       = 1;
};

struct SaleTierSpec {
  std::string   name;
  double        fee_flat               = 0.0;
  double        fee_percent            = 0.0;
  std::uint32_t offer_cycle_hours      = 24;
  double        success_chance         = 0.0;
  Range         return_range;
  std::uint32_t listing_lifetime_hours = 72;
};

struct InspectionTierSpec {
  std::string                        name;
  double                             fee_flat       = 0.0;
  double                             fee_percent    = 0.0;
  double                             fee_cap        = 0.0;
  std::uint32_t                      duration_hours = 1;
  std::vector<model::ConditionField> reveals;
};

struct PersonalitySpec {
  model::Personality personality          = model::Personality::kReasonable;
  double             dna_floor            = 0.0; // band is [dna_floor, next floor)
  double             acceptance_threshold = 0.0;
  double             tolerance            = 0.0;
  double             walk_away_chance     = 0.0;
};

/*
  Every tunable the engine reads. Defaults() carries the shipped balance;
  config overrides are layered on top by MarketTablesFromConfig.
*/
struct MarketTables {
  std::array<QualityTierSpec, model::kQualityTierCount>       quality;
  std::array<GenerationSpec, model::kGenerationCount>         generations;
  std::array<SearchTierSpec, model::kAgentTierCount>          search;
  std::array<SaleTierSpec, model::kAgentTierCount>            sale;
  std::array<InspectionTierSpec, model::kInspectionTierCount> inspection;
  std::array<PersonalitySpec, 5>                              personalities;

  std::uint32_t months_to_hours             = 24;
  std::uint32_t max_active_searches         = 5;
  std::uint32_t found_listing_window_hours  = 72;
  std::uint32_t sale_offer_window_hours     = 24;
  std::uint32_t tombstone_retention_periods = 12;
  double        commission_percent          = 0.08;
  bool          situation_modifiers         = true;

  // price = base * multiplier * (1 - min(max_age_discount, age * age_discount_per_year))
  double age_discount_per_year = 0.03;
  double max_age_discount      = 0.25;
  double min_price_fraction    = 0.05;
  Range  condition_clamp{0.01, 0.95};

  // engine, hydraulic, electrical
  std::array<double, 3> reliability_variance{0.20, 0.25, 0.15};
  Range                 reliability_clamp{0.10, 1.00};
  double                dna_spread = 0.25;

  double max_asking_price = 100'000'000.0;

  const QualityTierSpec&    Quality(model::QualityTier tier) const;
  const GenerationSpec&     Generation(model::GenerationClass generation) const;
  const SearchTierSpec&     Search(model::AgentTier tier) const;
  const SaleTierSpec&       Sale(model::AgentTier tier) const;
  const InspectionTierSpec& Inspection(model::InspectionTier tier) const;

  static MarketTables Defaults();
};

// Agent fee adjustment from the requester's credit score (negative = discount).
double CreditFeeModifier(std::uint32_t score);

double SearchRetainer(const SearchTierSpec& tier, double base_price, double credit_modifier);
double SaleAgentFee(const SaleTierSpec& tier, double vanilla_value);
double InspectionFee(const InspectionTierSpec& tier, double asking_price);

} // namespace usedgear::market
