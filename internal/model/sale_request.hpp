#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/tier.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::model {

struct OwnedItem {
  std::string   item_id;
  std::string   category_id;
  std::string   name;
  double        vanilla_value   = 0.0;
  double        base_price      = 0.0;
  std::uint32_t age_years       = 0;
  double        damage          = 0.0;
  double        wear            = 0.0;
  double        operating_hours = 0.0;
};

struct OfferEntry {
  double        amount    = 0.0;
  util::SimHour at_hour   = 0;
  bool          accepted  = false;
  bool          responded = false;
};

enum class SaleStatus : std::uint8_t {
  kSearching    = 1,
  kOfferPending = 2,
  kSold         = 3,
  kExpired      = 4,
  kCancelled    = 5,
};

/*
  One in-flight disposition job. The agent looks for a buyer in cycles;
  each successful cycle produces one pending offer.
*/
struct SaleRequest {
  std::string id;
  std::string owner_id;
  std::string listing_id;
  OwnedItem   item;
  AgentTier   agent_tier = AgentTier::kLocal;
  double      fee_paid   = 0.0;

  util::SimHour created_at_hour = 0;
  SaleStatus    status          = SaleStatus::kSearching;

  // 0 means no owner-set price.
  double asking_price = 0.0;
  double expected_min = 0.0;
  double expected_max = 0.0;

  // Expiry is tracked by the listing's TTL.
  std::uint32_t hours_until_cycle = 0;

  std::vector<OfferEntry>   offers;
  std::optional<OfferEntry> pending_offer;
  std::uint32_t             pending_offer_hours_remaining = 0;

  std::uint32_t offers_received = 0;
  std::uint32_t offers_declined = 0;
  std::uint32_t months_listed   = 0;
};

constexpr std::string_view ToString(SaleStatus status) {
  switch (status) {
    case SaleStatus::kSearching:
      return "searching";
    case SaleStatus::kOfferPending:
      return "offer_pending";
    case SaleStatus::kSold:
      return "sold";
    case SaleStatus::kExpired:
      return "expired";
    case SaleStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<SaleStatus> SaleStatusFromString(std::string_view value) {
  if (value == "searching") return SaleStatus::kSearching;
  if (value == "offer_pending") return SaleStatus::kOfferPending;
  if (value == "sold") return SaleStatus::kSold;
  if (value == "expired") return SaleStatus::kExpired;
  if (value == "cancelled") return SaleStatus::kCancelled;
  return std::nullopt;
}

} // namespace usedgear::model
