#pragma once

#include <string>

#include "internal/market/tier_tables.hpp"
#include "internal/model/listing.hpp"
#include "internal/model/negotiation.hpp"
#include "internal/util/random.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::negotiation {

struct OutcomeProbabilities {
  double accept    = 0.0;
  double counter   = 0.0;
  double reject    = 0.0;
  double walk_away = 0.0;
};

struct NegotiationOutcome {
  model::OutcomeKind kind      = model::OutcomeKind::kRejected;
  double             offer     = 0.0;
  double             price     = 0.0; // agreed price or counter price
  double             gap       = 0.0;
  double             threshold = 0.0;
  std::string        message;
};

/*
  Seller response model. Stateless: every call acts on the negotiation
  record passed in and mutates nothing else.

  gap = effective threshold - offer / asking price. Bands:
    gap <= 0         accept
    (0, 0.05]        counter
    (0.05, 0.10]     counter, reject chance rising to 30%
    (0.10, 0.15]     even split counter / reject
    (0.15, 0.20)     counter chance falling to 0, else reject
    >= 0.20          reject, walk-away roll by personality
  Immovable sellers accept only at 98% of asking and never counter below it.
*/
class NegotiationEngine {
 public:
  static constexpr double kImmovableFloor   = 0.98;
  static constexpr double kCounterRounding  = 100.0;
  static constexpr double kStandFirmAccept  = 0.30;
  static constexpr double kStandFirmHold    = 0.50;
  static constexpr std::uint32_t kLockHours = 1;

  explicit NegotiationEngine(const market::MarketTables& tables) : tables_(tables) {
  }

  static double WeatherModifier(model::Weather weather);

  // Circumstances that make the seller more (positive) or less willing.
  double SituationModifier(const model::ListingRecord& listing, util::SimHour now) const;

  static double EffectiveThreshold(const model::NegotiationRecord& record, double weather_modifier, double situation_modifier);

  static OutcomeProbabilities Probabilities(double gap, double offer_fraction, const model::NegotiationRecord& record);

  double CounterPrice(const model::NegotiationRecord& record, const model::ListingRecord& listing, double offer,
                      double threshold) const;

  NegotiationOutcome Evaluate(model::NegotiationRecord& record, const model::ListingRecord& listing, double offer,
                              model::Weather weather, util::SimHour now, util::Random& rng) const;

  // Buyer refuses the standing counter and repeats their last offer.
  NegotiationOutcome StandFirm(model::NegotiationRecord& record, const model::ListingRecord& listing, util::SimHour now,
                               util::Random& rng) const;

 private:
  const market::MarketTables& tables_;
};

} // namespace usedgear::negotiation
