#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/market/market_context.hpp"
#include "internal/model/sale_request.hpp"

namespace usedgear::disposition {

struct CancelSaleResult {
  model::SaleRequest sale;
  model::OwnedItem   returned_item;
};

struct AcceptOfferResult {
  model::SaleRequest sale;
  double             proceeds = 0.0;
};

/*
  Owner-initiated sales through an agent.

  Each sale owns one listing in the shared store. The agent works in
  cycles; a successful cycle puts a single buyer offer in front of the
  owner, who must answer before the window lapses.
*/
class DispositionQueue {
 public:
  model::SaleRequest ListForSale(market::MarketContext& ctx, const std::string& owner_id, const model::OwnedItem& item,
                                 std::int64_t agent_index);

  // The agent fee is forfeit.
  CancelSaleResult CancelSale(market::MarketContext& ctx, const std::string& sale_id, const std::string& owner_id);

  AcceptOfferResult AcceptOffer(market::MarketContext& ctx, const std::string& listing_id, const std::string& owner_id);

  model::SaleRequest DeclineOffer(market::MarketContext& ctx, const std::string& listing_id,
                                  const std::string& owner_id);

  model::SaleRequest ModifyAskingPrice(market::MarketContext& ctx, const std::string& sale_id,
                                       const std::string& owner_id, double asking_price);

  std::vector<model::SaleRequest> Sales(const market::MarketContext& ctx, const std::string& owner_id) const;

  // Success chance of one offer cycle, after the asking-price penalty.
  static double CycleSuccessChance(const market::MarketTables& tables, const model::SaleRequest& sale);

  void OnHourTick(market::MarketContext& ctx, std::uint64_t elapsed_hours);

  void OnPeriodTick(market::MarketContext& ctx);

 private:
  model::SaleRequest& RequireSale(market::MarketContext& ctx, const std::string& sale_id, const std::string& owner_id);

  model::SaleRequest& RequirePendingSale(market::MarketContext& ctx, const std::string& listing_id,
                                         const std::string& owner_id);

  void GenerateOffer(market::MarketContext& ctx, model::SaleRequest& sale, model::ListingRecord& listing);

  void LapseOffer(market::MarketContext& ctx, model::SaleRequest& sale, model::ListingRecord& listing);

  void Expire(market::MarketContext& ctx, const std::string& sale_id);
};

} // namespace usedgear::disposition
