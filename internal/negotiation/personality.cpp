#include "personality.hpp"

#include <stdexcept>
#include <string>

namespace usedgear::negotiation {

model::Personality PersonalityFor(const market::MarketTables& tables, double dna) {
  // Bands are [dna_floor, next floor); the table is ordered by floor.
  auto chosen = tables.personalities.front().personality;
  for (const auto& spec : tables.personalities) {
    if (dna >= spec.dna_floor) chosen = spec.personality;
  }
  return chosen;
}

const market::PersonalitySpec& SpecFor(const market::MarketTables& tables, model::Personality personality) {
  for (const auto& spec : tables.personalities) {
    if (spec.personality == personality) return spec;
  }
  throw std::invalid_argument("no personality spec for " + std::string(model::ToString(personality)));
}

model::NegotiationRecord MakeNegotiationRecord(const market::MarketTables& tables, double dna) {
  const auto& spec = SpecFor(tables, PersonalityFor(tables, dna));

  model::NegotiationRecord record;
  record.personality          = spec.personality;
  record.acceptance_threshold = spec.acceptance_threshold;
  record.tolerance            = spec.tolerance;
  record.walk_away_chance     = spec.walk_away_chance;
  return record;
}

} // namespace usedgear::negotiation
