#pragma once

#include <cstdint>
#include <optional>

#include "internal/market/tier_tables.hpp"
#include "internal/model/listing.hpp"
#include "internal/model/tier.hpp"
#include "internal/util/random.hpp"

namespace usedgear::condition {

struct GeneratedCondition {
  model::VisibleCondition visible;
  model::HiddenCondition  hidden;
  double                  price_multiplier = 1.0;
  double                  price            = 0.0;
};

/*
  Rolls visible and hidden condition for a newly found listing.

  Visible damage and wear come from the quality tier, scaled by the
  agent's condition scale; hidden condition is derived from the visible
  roll plus noise so it correlates without being computable from it.
*/
class ConditionGenerator {
 public:
  explicit ConditionGenerator(const market::MarketTables& tables) : tables_(tables) {
  }

  GeneratedCondition Generate(util::Random& rng, model::QualityTier quality, model::AgentTier agent, double base_price,
                              std::optional<model::GenerationClass> forced_generation = std::nullopt) const;

  // Raw-index overload; out-of-range tiers fall back to Any / Regional.
  GeneratedCondition Generate(util::Random& rng, std::int64_t quality_index, std::int64_t agent_index, double base_price,
                              std::optional<model::GenerationClass> forced_generation = std::nullopt) const;

  model::GenerationClass PickGeneration(util::Random& rng, model::AgentTier agent) const;

  model::HiddenCondition DeriveHidden(util::Random& rng, const model::VisibleCondition& visible) const;

  // base * multiplier less the age discount, never below the price floor.
  double Price(double base_price, double multiplier, std::uint32_t age_years) const;

  static model::QualityTier ResolveQuality(std::int64_t index);
  static model::AgentTier   ResolveAgent(std::int64_t index);

 private:
  const market::MarketTables& tables_;
};

} // namespace usedgear::condition
