#include "market_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::core {

using market::MarketContext;
using observability::IntField;
using observability::StringField;

model::SearchRequest MarketEngine::RequestSearch(MarketContext& ctx, const std::string& requester_id,
                                                 const model::Category& category, std::int64_t quality_tier,
                                                 std::int64_t agent_tier) {
  return acquisition_.RequestSearch(ctx, requester_id, category, quality_tier, agent_tier);
}

model::SearchRequest MarketEngine::RenewSearch(MarketContext& ctx, const std::string& search_id,
                                               const std::string& requester_id) {
  return acquisition_.RenewSearch(ctx, search_id, requester_id);
}

model::SearchRequest MarketEngine::CancelSearch(MarketContext& ctx, const std::string& search_id,
                                                const std::string& requester_id) {
  return acquisition_.CancelSearch(ctx, search_id, requester_id);
}

std::vector<model::SearchRequest> MarketEngine::GetActiveSearches(const MarketContext& ctx,
                                                                  const std::string& requester_id) const {
  return acquisition_.ActiveSearches(ctx, requester_id);
}

model::ListingView MarketEngine::ViewListing(MarketContext& ctx, const std::string& listing_id,
                                             const std::string& requester_id) {
  return acquisition_.ViewListing(ctx, listing_id, requester_id);
}

acquisition::PurchaseResult MarketEngine::PurchaseListing(MarketContext& ctx, const std::string& listing_id,
                                                          const std::string& buyer_id) {
  return acquisition_.Purchase(ctx, listing_id, buyer_id);
}

acquisition::OfferResult MarketEngine::SubmitOffer(MarketContext& ctx, const std::string& listing_id,
                                                   const std::string& offerer_id, double amount) {
  return acquisition_.SubmitOffer(ctx, listing_id, offerer_id, amount);
}

acquisition::OfferResult MarketEngine::AcceptCounter(MarketContext& ctx, const std::string& listing_id,
                                                     const std::string& buyer_id) {
  return acquisition_.AcceptCounter(ctx, listing_id, buyer_id);
}

acquisition::OfferResult MarketEngine::StandFirm(MarketContext& ctx, const std::string& listing_id,
                                                 const std::string& buyer_id) {
  return acquisition_.StandFirm(ctx, listing_id, buyer_id);
}

model::SaleRequest MarketEngine::ListForSale(MarketContext& ctx, const std::string& owner_id,
                                             const model::OwnedItem& item, std::int64_t agent_tier) {
  return disposition_.ListForSale(ctx, owner_id, item, agent_tier);
}

disposition::CancelSaleResult MarketEngine::CancelSale(MarketContext& ctx, const std::string& sale_id,
                                                       const std::string& owner_id) {
  return disposition_.CancelSale(ctx, sale_id, owner_id);
}

disposition::AcceptOfferResult MarketEngine::AcceptOffer(MarketContext& ctx, const std::string& listing_id,
                                                         const std::string& owner_id) {
  return disposition_.AcceptOffer(ctx, listing_id, owner_id);
}

model::SaleRequest MarketEngine::DeclineOffer(MarketContext& ctx, const std::string& listing_id,
                                              const std::string& owner_id) {
  return disposition_.DeclineOffer(ctx, listing_id, owner_id);
}

model::SaleRequest MarketEngine::ModifySaleAskingPrice(MarketContext& ctx, const std::string& sale_id,
                                                       const std::string& owner_id, double asking_price) {
  return disposition_.ModifyAskingPrice(ctx, sale_id, owner_id, asking_price);
}

std::vector<model::SaleRequest> MarketEngine::GetSales(const MarketContext& ctx, const std::string& owner_id) const {
  return disposition_.Sales(ctx, owner_id);
}

std::vector<model::ListingView> MarketEngine::GetActiveListings(const MarketContext& ctx,
                                                                const std::string& requester_id) const {
  std::vector<model::ListingView> out;
  for (const auto* listing : ctx.listings.ByOwner(requester_id)) {
    out.push_back(model::MakeView(*listing));
  }
  return out;
}

model::InspectionRecord MarketEngine::RequestInspection(MarketContext& ctx, const std::string& listing_id,
                                                        const std::string& requester_id, std::int64_t tier) {
  return inspection_.Request(ctx, listing_id, requester_id, tier);
}

model::InspectionRecord MarketEngine::CancelInspection(MarketContext& ctx, const std::string& listing_id,
                                                       const std::string& requester_id) {
  return inspection_.Cancel(ctx, listing_id, requester_id);
}

model::InspectionRecord MarketEngine::GetInspection(const MarketContext& ctx, const std::string& listing_id) const {
  return inspection_.Get(ctx, listing_id);
}

std::uint32_t MarketEngine::InspectionHoursRemaining(const MarketContext& ctx,
                                                     const model::InspectionRecord& record) const {
  return inspection::InspectionService::HoursRemaining(ctx, record);
}

std::uint32_t MarketEngine::GetHoursRemaining(const MarketContext& ctx, const std::string& id) const {
  if (const auto* listing = ctx.listings.Find(id)) {
    if (listing->origin == model::ListingOrigin::kSale) {
      auto sale = ctx.sales.find(listing->source_id);
      if (sale != ctx.sales.end() && sale->second.status == model::SaleStatus::kOfferPending) {
        return sale->second.pending_offer_hours_remaining;
      }
    }
    return listing->ttl_hours;
  }

  if (auto search = ctx.searches.find(id); search != ctx.searches.end()) {
    return search->second.ttl_hours;
  }

  if (auto sale = ctx.sales.find(id); sale != ctx.sales.end()) {
    const auto* listing = ctx.listings.Find(sale->second.listing_id);
    return listing == nullptr ? 0 : listing->ttl_hours;
  }

  throw util::NotFound("No live listing, search or sale with id " + id);
}

std::uint64_t MarketEngine::OnHourTick(MarketContext& ctx, util::SimHour hour) {
  const auto previous = ctx.clock.Now();
  const auto elapsed  = ctx.clock.AdvanceTo(hour);
  if (elapsed == 0) {
    USEDGEAR_LOG_WARN("Hour tick not ahead of clock, ignored",
                      {IntField("hour", static_cast<std::int64_t>(hour)), IntField("now", static_cast<std::int64_t>(previous))});
    return 0;
  }

  // Expiry runs before inspection completion so a hold covers its whole
  // final hour.
  acquisition_.OnHourTick(ctx, elapsed);
  disposition_.OnHourTick(ctx, elapsed);
  inspection_.OnHourTick(ctx);

  USEDGEAR_LOG_DEBUG("Hour tick", {IntField("hour", static_cast<std::int64_t>(hour)),
                                   IntField("elapsed", static_cast<std::int64_t>(elapsed)),
                                   IntField("listings", static_cast<std::int64_t>(ctx.listings.Live().size()))});
  return elapsed;
}

void MarketEngine::OnPeriodTick(MarketContext& ctx, std::uint32_t period) {
  ctx.clock.SetPeriod(period);
  disposition_.OnPeriodTick(ctx);

  const auto pruned = ctx.listings.PruneTombstones(period, ctx.tables.tombstone_retention_periods);
  USEDGEAR_LOG_INFO("Period tick", {IntField("period", period), IntField("tombstones_pruned", static_cast<std::int64_t>(pruned))});
}

} // namespace usedgear::core
