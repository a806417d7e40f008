#include "condition_generator.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"

namespace usedgear::condition {

using observability::IntField;
using observability::StringField;

namespace {

double Clamp(double value, const market::Range& range) {
  return std::clamp(value, range.min, range.max);
}

} // namespace

model::QualityTier ConditionGenerator::ResolveQuality(std::int64_t index) {
  if (auto tier = model::QualityTierFromIndex(index)) return *tier;
  USEDGEAR_LOG_WARN("Quality tier out of range, using any", {IntField("index", index)});
  return model::QualityTier::kAny;
}

model::AgentTier ConditionGenerator::ResolveAgent(std::int64_t index) {
  if (auto tier = model::AgentTierFromIndex(index)) return *tier;
  USEDGEAR_LOG_WARN("Agent tier out of range, using regional", {IntField("index", index)});
  return model::AgentTier::kRegional;
}

model::GenerationClass ConditionGenerator::PickGeneration(util::Random& rng, model::AgentTier agent) const {
  const auto& weights = tables_.Search(agent).generation_weights;

  double total = 0.0;
  for (double w : weights) total += std::max(0.0, w);
  if (total <= 0.0) return model::GenerationClass::kMidAge;

  double roll = rng.Unit() * total;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    const double w = std::max(0.0, weights[i]);
    if (roll < w) return static_cast<model::GenerationClass>(i);
    roll -= w;
  }
  return model::GenerationClass::kOld;
}

model::HiddenCondition ConditionGenerator::DeriveHidden(util::Random& rng, const model::VisibleCondition& visible) const {
  model::HiddenCondition hidden;

  hidden.dna = std::clamp(1.0 - visible.damage + rng.Bell(tables_.dna_spread), 0.0, 1.0);

  const double health = 1.0 - visible.damage;
  const auto&  var    = tables_.reliability_variance;
  hidden.engine_reliability     = Clamp(health + rng.Uniform(-var[0], var[0]), tables_.reliability_clamp);
  hidden.hydraulic_reliability  = Clamp(health + rng.Uniform(-var[1], var[1]), tables_.reliability_clamp);
  hidden.electrical_reliability = Clamp(health + rng.Uniform(-var[2], var[2]), tables_.reliability_clamp);

  // Poor DNA lowers the ceiling faster with age and use.
  const double usage         = visible.operating_hours / 500.0 + static_cast<double>(visible.age_years);
  hidden.reliability_ceiling = std::clamp(1.0 - (1.0 - hidden.dna) * 0.01 * usage, 0.30, 1.0);

  const double mean =
      (hidden.engine_reliability + hidden.hydraulic_reliability + hidden.electrical_reliability) / 3.0;
  hidden.overall_rating = std::round(std::min(mean, hidden.reliability_ceiling) * 100.0);

  return hidden;
}

double ConditionGenerator::Price(double base_price, double multiplier, std::uint32_t age_years) const {
  const double discount = std::min(tables_.max_age_discount, tables_.age_discount_per_year * age_years);
  const double floor    = base_price * tables_.min_price_fraction;
  const double price    = std::floor(base_price * multiplier * (1.0 - discount));
  return std::max(price, std::ceil(floor));
}

GeneratedCondition ConditionGenerator::Generate(util::Random& rng, model::QualityTier quality, model::AgentTier agent,
                                                double base_price,
                                                std::optional<model::GenerationClass> forced_generation) const {
  const auto& quality_spec = tables_.Quality(quality);
  const auto& search_spec  = tables_.Search(agent);

  GeneratedCondition out;

  const auto  generation = forced_generation ? *forced_generation : PickGeneration(rng, agent);
  const auto& gen_spec   = tables_.Generation(generation);

  out.visible.generation = generation;
  out.visible.age_years  = static_cast<std::uint32_t>(rng.UniformInt(static_cast<std::int64_t>(gen_spec.age_years.min),
                                                                     static_cast<std::int64_t>(gen_spec.age_years.max)));
  out.visible.operating_hours =
      std::round(out.visible.age_years * rng.Uniform(gen_spec.hours_per_year.min, gen_spec.hours_per_year.max));

  out.visible.damage =
      Clamp(rng.Uniform(quality_spec.damage.min, quality_spec.damage.max) * search_spec.condition_scale, tables_.condition_clamp);
  out.visible.wear =
      Clamp(rng.Uniform(quality_spec.wear.min, quality_spec.wear.max) * search_spec.condition_scale, tables_.condition_clamp);

  out.hidden           = DeriveHidden(rng, out.visible);
  out.price_multiplier = rng.Uniform(quality_spec.price_multiplier.min, quality_spec.price_multiplier.max);
  out.price            = Price(base_price, out.price_multiplier, out.visible.age_years);

  USEDGEAR_LOG_DEBUG("Condition generated",
                     {StringField("quality", model::ToString(quality)), StringField("agent", model::ToString(agent)),
                      StringField("generation", model::ToString(generation)), IntField("age_years", out.visible.age_years)});
  return out;
}

GeneratedCondition ConditionGenerator::Generate(util::Random& rng, std::int64_t quality_index, std::int64_t agent_index,
                                                double base_price,
                                                std::optional<model::GenerationClass> forced_generation) const {
  return Generate(rng, ResolveQuality(quality_index), ResolveAgent(agent_index), base_price, forced_generation);
}

} // namespace usedgear::condition
