#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/acquisition/acquisition_queue.hpp"
#include "internal/disposition/disposition_queue.hpp"
#include "internal/inspection/inspection_service.hpp"
#include "internal/market/market_context.hpp"

namespace usedgear::core {

/*
  Entry point for every host/UI operation and both clock events.

  Holds no market state of its own: each call acts on the MarketContext
  it is given, so one engine can drive any number of independent markets.
*/
class MarketEngine {
 public:
  // -------------------------------------------------------------------
  // Acquisition
  // -------------------------------------------------------------------
  model::SearchRequest RequestSearch(market::MarketContext& ctx, const std::string& requester_id,
                                     const model::Category& category, std::int64_t quality_tier,
                                     std::int64_t agent_tier);
  model::SearchRequest RenewSearch(market::MarketContext& ctx, const std::string& search_id,
                                   const std::string& requester_id);
  model::SearchRequest CancelSearch(market::MarketContext& ctx, const std::string& search_id,
                                    const std::string& requester_id);
  std::vector<model::SearchRequest> GetActiveSearches(const market::MarketContext& ctx,
                                                      const std::string& requester_id) const;

  model::ListingView           ViewListing(market::MarketContext& ctx, const std::string& listing_id,
                                           const std::string& requester_id);
  acquisition::PurchaseResult  PurchaseListing(market::MarketContext& ctx, const std::string& listing_id,
                                               const std::string& buyer_id);
  acquisition::OfferResult     SubmitOffer(market::MarketContext& ctx, const std::string& listing_id,
                                           const std::string& offerer_id, double amount);
  acquisition::OfferResult     AcceptCounter(market::MarketContext& ctx, const std::string& listing_id,
                                             const std::string& buyer_id);
  acquisition::OfferResult     StandFirm(market::MarketContext& ctx, const std::string& listing_id,
                                         const std::string& buyer_id);

  // -------------------------------------------------------------------
  // Disposition
  // -------------------------------------------------------------------
  model::SaleRequest ListForSale(market::MarketContext& ctx, const std::string& owner_id, const model::OwnedItem& item,
                                 std::int64_t agent_tier);
  disposition::CancelSaleResult  CancelSale(market::MarketContext& ctx, const std::string& sale_id,
                                            const std::string& owner_id);
  disposition::AcceptOfferResult AcceptOffer(market::MarketContext& ctx, const std::string& listing_id,
                                             const std::string& owner_id);
  model::SaleRequest             DeclineOffer(market::MarketContext& ctx, const std::string& listing_id,
                                              const std::string& owner_id);
  model::SaleRequest             ModifySaleAskingPrice(market::MarketContext& ctx, const std::string& sale_id,
                                                       const std::string& owner_id, double asking_price);
  std::vector<model::SaleRequest> GetSales(const market::MarketContext& ctx, const std::string& owner_id) const;

  // Live listings owned by the requester, found and for-sale alike.
  std::vector<model::ListingView> GetActiveListings(const market::MarketContext& ctx,
                                                    const std::string& requester_id) const;

  // -------------------------------------------------------------------
  // Inspection
  // -------------------------------------------------------------------
  model::InspectionRecord RequestInspection(market::MarketContext& ctx, const std::string& listing_id,
                                            const std::string& requester_id, std::int64_t tier);
  model::InspectionRecord CancelInspection(market::MarketContext& ctx, const std::string& listing_id,
                                           const std::string& requester_id);
  model::InspectionRecord GetInspection(const market::MarketContext& ctx, const std::string& listing_id) const;
  std::uint32_t           InspectionHoursRemaining(const market::MarketContext& ctx,
                                                   const model::InspectionRecord& record) const;

  // Hours left on a listing, search or sale id. Throws NotFound for ids
  // that are unknown or no longer live.
  std::uint32_t GetHoursRemaining(const market::MarketContext& ctx, const std::string& id) const;

  // -------------------------------------------------------------------
  // Clock
  // -------------------------------------------------------------------
  // Advances to `hour` and runs every timer. Returns the elapsed hours;
  // a tick that is not ahead of the clock does nothing.
  std::uint64_t OnHourTick(market::MarketContext& ctx, util::SimHour hour);

  void OnPeriodTick(market::MarketContext& ctx, std::uint32_t period);

 private:
  acquisition::AcquisitionQueue   acquisition_;
  disposition::DispositionQueue   disposition_;
  inspection::InspectionService   inspection_;
};

} // namespace usedgear::core
