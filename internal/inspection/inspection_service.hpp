#pragma once

#include <cstdint>
#include <string>

#include "internal/market/market_context.hpp"
#include "internal/model/inspection.hpp"

namespace usedgear::inspection {

/*
  Tiered, time-delayed reveal of a found listing's hidden condition.

  A request charges the fee, places a hold (which suspends the listing's
  offer-window countdown) and schedules completion. Completion happens on
  the first hour tick at or after completes_at_hour and is reported to the
  requester through the notification sink.
*/
class InspectionService {
 public:
  model::InspectionRecord Request(market::MarketContext& ctx, const std::string& listing_id,
                                  const std::string& requester_id, std::int64_t tier_index);

  // No refund.
  model::InspectionRecord Cancel(market::MarketContext& ctx, const std::string& listing_id,
                                 const std::string& requester_id);

  const model::InspectionRecord& Get(const market::MarketContext& ctx, const std::string& listing_id) const;

  static std::uint32_t HoursRemaining(const market::MarketContext& ctx, const model::InspectionRecord& record);

  void OnHourTick(market::MarketContext& ctx);

 private:
  void Complete(market::MarketContext& ctx, model::InspectionRecord& record);
};

} // namespace usedgear::inspection
