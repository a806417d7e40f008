#include "negotiation_engine.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"

namespace usedgear::negotiation {

using model::NegotiationState;
using model::OutcomeKind;
using model::Personality;
using observability::DoubleField;
using observability::StringField;

namespace {

constexpr double kFlatCounterGap   = 0.05;
constexpr double kRisingRejectGap  = 0.10;
constexpr double kEvenSplitGap     = 0.15;
constexpr double kWalkAwayGap      = 0.20;
constexpr double kBandSlope        = 6.0;

constexpr double kDailyMarketGain  = 0.003;
constexpr double kMaxMarketGain    = 0.10;
constexpr double kDamagedGain      = 0.05;
constexpr double kDamagedAbove     = 0.20;
constexpr double kHighHoursGain    = 0.03;
constexpr double kHighHoursAbove   = 5000.0;
constexpr double kPremiumLoss      = 0.05;
constexpr double kPremiumAbove     = 200'000.0;

std::string Money(double amount) {
  return fmt::format("${:.0f}", amount);
}

OutcomeKind Roll(const OutcomeProbabilities& p, util::Random& rng) {
  const double r = rng.Unit();
  if (r < p.accept) return OutcomeKind::kAccepted;
  if (r < p.accept + p.counter) return OutcomeKind::kCountered;
  if (r < p.accept + p.counter + p.reject) return OutcomeKind::kRejected;
  return p.walk_away > 0.0 ? OutcomeKind::kWalkedAway : OutcomeKind::kRejected;
}

} // namespace

double NegotiationEngine::WeatherModifier(model::Weather weather) {
  switch (weather) {
    case model::Weather::kHail:
      return 0.12;
    case model::Weather::kStorm:
      return 0.08;
    case model::Weather::kRain:
    case model::Weather::kSnow:
      return 0.05;
    default:
      return 0.0;
  }
}

double NegotiationEngine::SituationModifier(const model::ListingRecord& listing, util::SimHour now) const {
  if (!tables_.situation_modifiers) return 0.0;

  double modifier = 0.0;

  const auto hours_listed = now > listing.created_at_hour ? now - listing.created_at_hour : 0;
  const auto days_listed  = static_cast<double>(hours_listed / util::kHoursPerPeriod);
  modifier += std::min(kMaxMarketGain, days_listed * kDailyMarketGain);

  if (listing.condition.damage > kDamagedAbove) modifier += kDamagedGain;
  if (listing.condition.operating_hours > kHighHoursAbove) modifier += kHighHoursGain;
  if (listing.base_price > kPremiumAbove) modifier -= kPremiumLoss;

  return modifier;
}

double NegotiationEngine::EffectiveThreshold(const model::NegotiationRecord& record, double weather_modifier,
                                             double situation_modifier) {
  return record.acceptance_threshold - record.tolerance - weather_modifier - situation_modifier;
}

OutcomeProbabilities NegotiationEngine::Probabilities(double gap, double offer_fraction,
                                                      const model::NegotiationRecord& record) {
  OutcomeProbabilities p;

  if (record.personality == Personality::kImmovable) {
    if (offer_fraction >= kImmovableFloor) {
      p.accept = 1.0;
    } else if (gap <= 0.0) {
      p.counter = 1.0;
    } else if (gap < kWalkAwayGap) {
      p.reject = 1.0;
    } else {
      p.walk_away = record.walk_away_chance;
      p.reject    = 1.0 - p.walk_away;
    }
    return p;
  }

  if (gap <= 0.0) {
    p.accept = 1.0;
  } else if (gap <= kFlatCounterGap) {
    p.counter = 1.0;
  } else if (gap <= kRisingRejectGap) {
    p.reject  = (gap - kFlatCounterGap) * kBandSlope;
    p.counter = 1.0 - p.reject;
  } else if (gap <= kEvenSplitGap) {
    p.counter = 0.5;
    p.reject  = 0.5;
  } else if (gap < kWalkAwayGap) {
    p.counter = std::max(0.0, (kWalkAwayGap - gap) * kBandSlope);
    p.reject  = 1.0 - p.counter;
  } else {
    p.walk_away = std::clamp(record.walk_away_chance, 0.0, 1.0);
    p.reject    = 1.0 - p.walk_away;
  }
  return p;
}

double NegotiationEngine::CounterPrice(const model::NegotiationRecord& record, const model::ListingRecord& listing,
                                       double offer, double threshold) const {
  const double current_ask = model::CurrentAsk(listing);

  double floor = threshold * listing.asking_price;
  if (record.personality == Personality::kImmovable) {
    floor = std::max(floor, kImmovableFloor * listing.asking_price);
  }

  double counter = std::max((offer + current_ask) / 2.0, floor);
  counter        = std::ceil(counter / kCounterRounding) * kCounterRounding;
  return std::min(counter, current_ask);
}

NegotiationOutcome NegotiationEngine::Evaluate(model::NegotiationRecord& record, const model::ListingRecord& listing,
                                               double offer, model::Weather weather, util::SimHour now,
                                               util::Random& rng) const {
  NegotiationOutcome outcome;
  outcome.offer = offer;

  const double weather_modifier = WeatherModifier(weather);
  const double situation        = SituationModifier(listing, now);
  const double offer_fraction   = listing.asking_price > 0.0 ? offer / listing.asking_price : 0.0;

  outcome.threshold = EffectiveThreshold(record, weather_modifier, situation);
  outcome.gap       = outcome.threshold - offer_fraction;

  record.round += 1;
  record.last_offer       = offer;
  record.weather_modifier = weather_modifier;

  outcome.kind = Roll(Probabilities(outcome.gap, offer_fraction, record), rng);

  if (outcome.kind == OutcomeKind::kCountered) {
    const double counter = CounterPrice(record, listing, offer, outcome.threshold);
    if (counter <= offer) {
      outcome.kind = OutcomeKind::kAccepted;
    } else {
      outcome.price        = counter;
      record.counter_price = counter;
      record.state         = NegotiationState::kCountered;
      outcome.message      = "Seller countered at " + Money(counter);
    }
  }

  switch (outcome.kind) {
    case OutcomeKind::kAccepted:
      outcome.price   = offer;
      record.state    = NegotiationState::kAwaitingOffer;
      outcome.message = "Seller accepted " + Money(offer);
      break;
    case OutcomeKind::kRejected:
      record.state    = NegotiationState::kAwaitingOffer;
      outcome.price   = model::CurrentAsk(listing);
      outcome.message = "Seller rejected " + Money(offer);
      break;
    case OutcomeKind::kWalkedAway:
      record.state    = NegotiationState::kAwaitingOffer;
      outcome.message = "Seller walked away after an offer of " + Money(offer);
      break;
    case OutcomeKind::kCountered:
      break;
  }

  USEDGEAR_LOG_DEBUG("Offer evaluated", {StringField("listing_id", listing.id),
                                         StringField("personality", model::ToString(record.personality)),
                                         DoubleField("gap", outcome.gap), StringField("outcome", model::ToString(outcome.kind))});
  return outcome;
}

NegotiationOutcome NegotiationEngine::StandFirm(model::NegotiationRecord& record, const model::ListingRecord& listing,
                                                util::SimHour now, util::Random& rng) const {
  NegotiationOutcome outcome;
  outcome.offer = record.last_offer;

  const double r = rng.Unit();
  if (r < kStandFirmAccept) {
    outcome.kind    = OutcomeKind::kAccepted;
    outcome.price   = record.last_offer;
    record.state    = NegotiationState::kAwaitingOffer;
    outcome.message = "Seller gave in and accepted " + Money(record.last_offer);
  } else if (r < kStandFirmAccept + kStandFirmHold) {
    outcome.kind    = OutcomeKind::kCountered;
    outcome.price   = record.counter_price;
    outcome.message = "Seller stands by the counter of " + Money(record.counter_price);
  } else {
    outcome.kind             = OutcomeKind::kRejected;
    outcome.price            = model::CurrentAsk(listing);
    record.state             = NegotiationState::kAwaitingOffer;
    record.locked_until_hour = now + kLockHours;
    outcome.message          = "Seller is annoyed and will not take offers for a while";
  }

  USEDGEAR_LOG_DEBUG("Stand firm resolved",
                     {StringField("listing_id", listing.id), StringField("outcome", model::ToString(outcome.kind))});
  return outcome;
}

} // namespace usedgear::negotiation
