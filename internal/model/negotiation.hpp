#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/sim_clock.hpp"

namespace usedgear::model {

enum class Personality : std::uint8_t {
  kDesperate  = 1,
  kMotivated  = 2,
  kReasonable = 3,
  kFirm       = 4,
  kImmovable  = 5,
};

enum class Weather : std::uint8_t {
  kSun    = 0,
  kCloudy = 1,
  kRain   = 2,
  kStorm  = 3,
  kHail   = 4,
  kSnow   = 5,
  kFog    = 6,
};

enum class NegotiationState : std::uint8_t {
  kAwaitingOffer = 0,
  kCountered     = 1,
};

enum class OutcomeKind : std::uint8_t {
  kAccepted   = 1,
  kCountered  = 2,
  kRejected   = 3,
  kWalkedAway = 4,
};

/*
  Transient state attached to a listing while offers are exchanged.

  Personality and its threshold/tolerance are fixed when the listing is
  created and never re-rolled.
*/
struct NegotiationRecord {
  Personality personality          = Personality::kReasonable;
  double      acceptance_threshold = 0.0; // fraction of asking price
  double      tolerance            = 0.0;
  double      walk_away_chance     = 0.0;

  NegotiationState state            = NegotiationState::kAwaitingOffer;
  double           last_offer       = 0.0;
  double           counter_price    = 0.0; // latest seller counter, 0 = none
  std::uint32_t    round            = 0;
  double           weather_modifier = 0.0; // snapshot from the last offer

  // Seller refuses offers until this hour (stand-firm walk-off).
  util::SimHour locked_until_hour = 0;
};

constexpr std::string_view ToString(Personality personality) {
  switch (personality) {
    case Personality::kDesperate:
      return "desperate";
    case Personality::kMotivated:
      return "motivated";
    case Personality::kReasonable:
      return "reasonable";
    case Personality::kFirm:
      return "firm";
    case Personality::kImmovable:
      return "immovable";
  }
  return "unknown";
}

constexpr std::optional<Personality> PersonalityFromString(std::string_view value) {
  if (value == "desperate") return Personality::kDesperate;
  if (value == "motivated") return Personality::kMotivated;
  if (value == "reasonable") return Personality::kReasonable;
  if (value == "firm") return Personality::kFirm;
  if (value == "immovable") return Personality::kImmovable;
  return std::nullopt;
}

constexpr std::string_view ToString(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kAccepted:
      return "accepted";
    case OutcomeKind::kCountered:
      return "countered";
    case OutcomeKind::kRejected:
      return "rejected";
    case OutcomeKind::kWalkedAway:
      return "walked_away";
  }
  return "unknown";
}

constexpr std::string_view ToString(Weather weather) {
  switch (weather) {
    case Weather::kSun:
      return "sun";
    case Weather::kCloudy:
      return "cloudy";
    case Weather::kRain:
      return "rain";
    case Weather::kStorm:
      return "storm";
    case Weather::kHail:
      return "hail";
    case Weather::kSnow:
      return "snow";
    case Weather::kFog:
      return "fog";
  }
  return "unknown";
}

constexpr std::optional<Weather> WeatherFromString(std::string_view value) {
  if (value == "sun") return Weather::kSun;
  if (value == "cloudy") return Weather::kCloudy;
  if (value == "rain") return Weather::kRain;
  if (value == "storm") return Weather::kStorm;
  if (value == "hail") return Weather::kHail;
  if (value == "snow") return Weather::kSnow;
  if (value == "fog") return Weather::kFog;
  return std::nullopt;
}

} // namespace usedgear::model
