#pragma once

#include "internal/market/tier_tables.hpp"
#include "internal/model/negotiation.hpp"

namespace usedgear::negotiation {

// Seller personality from hidden DNA. Pure: the same DNA always gives the
// same personality.
model::Personality PersonalityFor(const market::MarketTables& tables, double dna);

const market::PersonalitySpec& SpecFor(const market::MarketTables& tables, model::Personality personality);

// Fresh negotiation state for a listing whose hidden DNA is `dna`.
model::NegotiationRecord MakeNegotiationRecord(const market::MarketTables& tables, double dna);

} // namespace usedgear::negotiation
