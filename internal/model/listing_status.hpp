#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace usedgear::model {

enum class ListingStatus : std::uint8_t {
  kSearching   = 1,
  kFound       = 2,
  kNegotiating = 3,
  kSold        = 4,
  kExpired     = 5,
  kWithdrawn   = 6,
};

constexpr bool IsTerminal(ListingStatus status) {
  return status == ListingStatus::kSold || status == ListingStatus::kExpired || status == ListingStatus::kWithdrawn;
}

constexpr bool CanTransition(ListingStatus from, ListingStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case ListingStatus::kSearching:
      // sale listing: declined or lapsed offer resumes the agent search
      return from == ListingStatus::kNegotiating;
    case ListingStatus::kFound:
      return from == ListingStatus::kNegotiating;
    case ListingStatus::kNegotiating:
      return from == ListingStatus::kSearching || from == ListingStatus::kFound;
    case ListingStatus::kSold:
    case ListingStatus::kExpired:
    case ListingStatus::kWithdrawn:
      return true;
  }
  return false;
}

constexpr std::string_view ToString(ListingStatus status) {
  switch (status) {
    case ListingStatus::kSearching:
      return "searching";
    case ListingStatus::kFound:
      return "found";
    case ListingStatus::kNegotiating:
      return "negotiating";
    case ListingStatus::kSold:
      return "sold";
    case ListingStatus::kExpired:
      return "expired";
    case ListingStatus::kWithdrawn:
      return "withdrawn";
  }
  return "unknown";
}

constexpr std::optional<ListingStatus> ListingStatusFromString(std::string_view value) {
  if (value == "searching") return ListingStatus::kSearching;
  if (value == "found") return ListingStatus::kFound;
  if (value == "negotiating") return ListingStatus::kNegotiating;
  if (value == "sold") return ListingStatus::kSold;
  if (value == "expired") return ListingStatus::kExpired;
  if (value == "withdrawn") return ListingStatus::kWithdrawn;
  return std::nullopt;
}

} // namespace usedgear::model
