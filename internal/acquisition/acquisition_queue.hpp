#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/market/market_context.hpp"
#include "internal/model/listing.hpp"
#include "internal/model/search_request.hpp"
#include "internal/negotiation/negotiation_engine.hpp"

namespace usedgear::acquisition {

struct PurchaseResult {
  model::ListingView listing;
  double             price_paid = 0.0;
};

struct OfferResult {
  negotiation::NegotiationOutcome outcome;
  std::string                     listing_id;
  model::Personality              personality    = model::Personality::kReasonable;
  model::ListingStatus            listing_status = model::ListingStatus::kNegotiating;
  double                          price_paid     = 0.0;
};

/*
  Search requests and the listings they find.

  Owns SearchRequest records and found listings: only this queue writes
  them. Every public operation validates and debits before it mutates.
*/
class AcquisitionQueue {
 public:
  model::SearchRequest RequestSearch(market::MarketContext& ctx, const std::string& requester_id,
                                     const model::Category& category, std::int64_t quality_index,
                                     std::int64_t agent_index);

  // Starts a new search with the parameters of a failed or succeeded one,
  // charging the retainer again. A failed search is replaced; a succeeded
  // one keeps its found listings.
  model::SearchRequest RenewSearch(market::MarketContext& ctx, const std::string& search_id,
                                   const std::string& requester_id);

  model::SearchRequest CancelSearch(market::MarketContext& ctx, const std::string& search_id,
                                    const std::string& requester_id);

  std::vector<model::SearchRequest> ActiveSearches(const market::MarketContext& ctx,
                                                   const std::string& requester_id) const;

  // Marks the listing viewed, which starts its offer-window countdown.
  model::ListingView ViewListing(market::MarketContext& ctx, const std::string& listing_id,
                                 const std::string& requester_id);

  PurchaseResult Purchase(market::MarketContext& ctx, const std::string& listing_id, const std::string& buyer_id);

  OfferResult SubmitOffer(market::MarketContext& ctx, const std::string& listing_id, const std::string& offerer_id,
                          double amount);

  OfferResult AcceptCounter(market::MarketContext& ctx, const std::string& listing_id, const std::string& buyer_id);

  OfferResult StandFirm(market::MarketContext& ctx, const std::string& listing_id, const std::string& buyer_id);

  void OnHourTick(market::MarketContext& ctx, std::uint64_t elapsed_hours);

 private:
  model::SearchRequest OpenSearch(market::MarketContext& ctx, const std::string& requester_id,
                                  const model::Category& category, model::QualityTier quality, model::AgentTier agent);

  model::ListingRecord& RequireOpenListing(market::MarketContext& ctx, const std::string& listing_id,
                                           const std::string& actor);

  void ResolveSearch(market::MarketContext& ctx, model::SearchRequest& search);

  // Debits the buyer and retires the listing as sold.
  void CompletePurchase(market::MarketContext& ctx, const model::ListingRecord& listing, const std::string& buyer_id,
                        double price);

  OfferResult ApplyOutcome(market::MarketContext& ctx, model::ListingRecord& listing, const std::string& buyer_id,
                           const model::NegotiationRecord& updated, const negotiation::NegotiationOutcome& outcome);
};

} // namespace usedgear::acquisition
