#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/tier.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::model {

enum class InspectionState : std::uint8_t {
  kPending   = 1,
  kComplete  = 2,
  kCancelled = 3,
};

struct InspectionRecord {
  std::string    id;
  std::string    listing_id;
  std::string    requester_id;
  InspectionTier tier     = InspectionTier::kQuick;
  double         fee_paid = 0.0;

  util::SimHour requested_at_hour = 0;
  util::SimHour completes_at_hour = 0;

  InspectionState state = InspectionState::kPending;
};

constexpr std::string_view ToString(InspectionState state) {
  switch (state) {
    case InspectionState::kPending:
      return "pending";
    case InspectionState::kComplete:
      return "complete";
    case InspectionState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<InspectionState> InspectionStateFromString(std::string_view value) {
  if (value == "pending") return InspectionState::kPending;
  if (value == "complete") return InspectionState::kComplete;
  if (value == "cancelled") return InspectionState::kCancelled;
  return std::nullopt;
}

} // namespace usedgear::model
