#include "market_service.hpp"

#include <exception>
#include <stdexcept>

#include "internal/core/market_engine.hpp"
#include "internal/host/standalone_host.hpp"
#include "internal/market/market_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/persistence/snapshot_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::service {

using namespace usedgear::market::v1;
using observability::StringField;

namespace {

template <typename ProtoEnum, typename ModelEnum>
ProtoEnum ToProtoEnum(ModelEnum value) {
  return static_cast<ProtoEnum>(static_cast<int>(value));
}

model::Category FromProto(const Category& category) {
  return {category.id(), category.name(), category.base_price()};
}

model::OwnedItem FromProto(const OwnedItem& item) {
  model::OwnedItem out;
  out.item_id         = item.item_id();
  out.category_id     = item.category_id();
  out.name            = item.name();
  out.vanilla_value   = item.vanilla_value();
  out.base_price      = item.base_price();
  out.age_years       = item.age_years();
  out.damage          = item.damage();
  out.wear            = item.wear();
  out.operating_hours = item.operating_hours();
  return out;
}

void ToProto(const model::OwnedItem& item, OwnedItem* out) {
  out->set_item_id(item.item_id);
  out->set_category_id(item.category_id);
  out->set_name(item.name);
  out->set_vanilla_value(item.vanilla_value);
  out->set_base_price(item.base_price);
  out->set_age_years(item.age_years);
  out->set_damage(item.damage);
  out->set_wear(item.wear);
  out->set_operating_hours(item.operating_hours);
}

void ToProto(const model::ListingView& view, ListingView* out) {
  out->set_id(view.id);
  out->set_category_id(view.category_id);
  out->set_category_name(view.category_name);
  out->set_owner_id(view.owner_id);
  out->set_status(ToProtoEnum<ListingStatus>(view.status));
  out->set_created_at_hour(view.created_at_hour);
  out->set_ttl_hours(view.ttl_hours);
  out->set_on_hold(view.on_hold);
  out->set_viewed(view.viewed);
  out->set_search_id(view.source_id);

  out->set_age_years(view.condition.age_years);
  out->set_damage(view.condition.damage);
  out->set_wear(view.condition.wear);
  out->set_operating_hours(view.condition.operating_hours);

  out->set_base_price(view.base_price);
  out->set_price(view.price);
  out->set_commission(view.commission);
  out->set_asking_price(view.asking_price);
  out->set_current_ask(view.current_ask);

  if (view.overall_rating) out->set_overall_rating(*view.overall_rating);
  if (view.engine_reliability) out->set_engine_reliability(*view.engine_reliability);
  if (view.hydraulic_reliability) out->set_hydraulic_reliability(*view.hydraulic_reliability);
  if (view.electrical_reliability) out->set_electrical_reliability(*view.electrical_reliability);
  if (view.reliability_ceiling) out->set_reliability_ceiling(*view.reliability_ceiling);
  if (view.quality_hint) out->set_quality_hint(*view.quality_hint);
  for (auto field : view.revealed_fields) {
    out->add_revealed_fields(std::string(model::ToString(field)));
  }
}

void ToProto(const market::MarketContext& ctx, const model::SearchRequest& search, SearchView* out) {
  out->set_id(search.id);
  out->set_requester_id(search.requester_id);
  out->mutable_category()->set_id(search.category.id);
  out->mutable_category()->set_name(search.category.name);
  out->mutable_category()->set_base_price(search.category.base_price);
  out->set_quality_tier(static_cast<std::uint32_t>(search.quality_tier));
  out->set_agent_tier(static_cast<std::uint32_t>(search.agent_tier));
  out->set_fee_paid(search.fee_paid);
  out->set_created_at_hour(search.created_at_hour);
  out->set_hours_remaining(search.status == model::SearchStatus::kActive
                               ? util::HoursUntil(ctx.clock.Now(), search.completes_at_hour)
                               : 0);
  out->set_status(ToProtoEnum<SearchStatus>(search.status));
  for (const auto& id : search.result_ids) {
    // consumed results are tombstoned, not listed
    if (ctx.listings.Find(id) != nullptr) out->add_listing_ids(id);
  }
}

void ToProto(const model::OfferEntry& offer, OfferView* out) {
  out->set_amount(offer.amount);
  out->set_at_hour(offer.at_hour);
  out->set_accepted(offer.accepted);
  out->set_responded(offer.responded);
}

void ToProto(const market::MarketContext& ctx, const model::SaleRequest& sale, SaleView* out) {
  out->set_id(sale.id);
  out->set_owner_id(sale.owner_id);
  out->set_listing_id(sale.listing_id);
  ToProto(sale.item, out->mutable_item());
  out->set_agent_tier(static_cast<std::uint32_t>(sale.agent_tier));
  out->set_fee_paid(sale.fee_paid);
  out->set_created_at_hour(sale.created_at_hour);
  out->set_status(ToProtoEnum<SaleStatus>(sale.status));
  out->set_asking_price(sale.asking_price);
  out->set_expected_min(sale.expected_min);
  out->set_expected_max(sale.expected_max);
  out->set_hours_until_next_cycle(sale.hours_until_cycle);
  if (const auto* listing = ctx.listings.Find(sale.listing_id)) {
    out->set_hours_until_expiry(listing->ttl_hours);
  }
  out->set_offers_received(sale.offers_received);
  out->set_offers_declined(sale.offers_declined);
  out->set_months_listed(sale.months_listed);
  for (const auto& offer : sale.offers) {
    ToProto(offer, out->add_offers());
  }
  if (sale.pending_offer) ToProto(*sale.pending_offer, out->mutable_pending_offer());
  out->set_pending_offer_hours_remaining(sale.pending_offer_hours_remaining);
}

void ToProto(const market::MarketContext& ctx, const model::InspectionRecord& inspection, InspectionView* out) {
  out->set_id(inspection.id);
  out->set_listing_id(inspection.listing_id);
  out->set_requester_id(inspection.requester_id);
  out->set_tier(static_cast<std::uint32_t>(inspection.tier));
  out->set_fee_paid(inspection.fee_paid);
  out->set_requested_at_hour(inspection.requested_at_hour);
  out->set_completes_at_hour(inspection.completes_at_hour);
  out->set_hours_remaining(inspection::InspectionService::HoursRemaining(ctx, inspection));
  out->set_state(ToProtoEnum<InspectionState>(inspection.state));
}

void ToProto(const acquisition::OfferResult& result, NegotiationOutcome* out) {
  out->set_kind(ToProtoEnum<OutcomeKind>(result.outcome.kind));
  out->set_listing_id(result.listing_id);
  out->set_offer_amount(result.outcome.offer);
  if (result.outcome.kind == model::OutcomeKind::kCountered) {
    out->set_counter_price(result.outcome.price);
  }
  out->set_price_paid(result.price_paid);
  out->set_personality(ToProtoEnum<Personality>(result.personality));
  out->set_gap(result.outcome.gap);
  out->set_listing_status(ToProtoEnum<ListingStatus>(result.listing_status));
  out->set_message(result.outcome.message);
}

template <typename Response>
void DrainInto(host::QueueNotificationSink& sink, Response& resp) {
  for (const auto& n : sink.Drain()) {
    auto* out = resp.add_notifications();
    out->set_owner_id(n.owner_id);
    out->set_message(n.message);
    out->set_severity(ToProtoEnum<Severity>(n.severity));
  }
}

} // namespace

MarketService::MarketService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine || !ctx_.market || !ctx_.notifications) {
    throw std::invalid_argument("market service requires engine, market and notification sink");
  }
}

template <typename Fn>
auto MarketService::Run(const char* route, Fn&& fn) -> decltype(fn()) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    return fn();
  } catch (const util::ValidationError& ex) {
    USEDGEAR_LOG_WARN("RPC rejected", {StringField("route", route), StringField("error", ex.what())});
    throw;
  } catch (const util::RaceRejection& ex) {
    USEDGEAR_LOG_WARN("RPC rejected", {StringField("route", route), StringField("error", ex.what())});
    throw;
  } catch (const util::FundsError& ex) {
    USEDGEAR_LOG_WARN("RPC rejected", {StringField("route", route), StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    USEDGEAR_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

// ---------------------------------------------------------------------
// Acquisition
// ---------------------------------------------------------------------

RequestSearchResponse MarketService::RequestSearch(const RequestSearchRequest& req) {
  return Run("MarketService.RequestSearch", [&] {
    RequestSearchResponse resp;
    auto search = ctx_.engine->RequestSearch(*ctx_.market, req.requester_id(), FromProto(req.category()),
                                             req.quality_tier(), req.agent_tier());
    ToProto(*ctx_.market, search, resp.mutable_search());
    return resp;
  });
}

RenewSearchResponse MarketService::RenewSearch(const RenewSearchRequest& req) {
  return Run("MarketService.RenewSearch", [&] {
    RenewSearchResponse resp;
    auto search = ctx_.engine->RenewSearch(*ctx_.market, req.search_id(), req.requester_id());
    ToProto(*ctx_.market, search, resp.mutable_search());
    return resp;
  });
}

CancelSearchResponse MarketService::CancelSearch(const CancelSearchRequest& req) {
  return Run("MarketService.CancelSearch", [&] {
    CancelSearchResponse resp;
    auto search = ctx_.engine->CancelSearch(*ctx_.market, req.search_id(), req.requester_id());
    ToProto(*ctx_.market, search, resp.mutable_search());
    return resp;
  });
}

GetActiveSearchesResponse MarketService::GetActiveSearches(const GetActiveSearchesRequest& req) {
  return Run("MarketService.GetActiveSearches", [&] {
    GetActiveSearchesResponse resp;
    for (const auto& search : ctx_.engine->GetActiveSearches(*ctx_.market, req.requester_id())) {
      ToProto(*ctx_.market, search, resp.add_searches());
    }
    return resp;
  });
}

ViewListingResponse MarketService::ViewListing(const ViewListingRequest& req) {
  return Run("MarketService.ViewListing", [&] {
    ViewListingResponse resp;
    ToProto(ctx_.engine->ViewListing(*ctx_.market, req.listing_id(), req.requester_id()), resp.mutable_listing());
    return resp;
  });
}

PurchaseListingResponse MarketService::PurchaseListing(const PurchaseListingRequest& req) {
  return Run("MarketService.PurchaseListing", [&] {
    PurchaseListingResponse resp;
    auto result = ctx_.engine->PurchaseListing(*ctx_.market, req.listing_id(), req.buyer_id());
    ToProto(result.listing, resp.mutable_listing());
    resp.set_price_paid(result.price_paid);
    return resp;
  });
}

SubmitOfferResponse MarketService::SubmitOffer(const SubmitOfferRequest& req) {
  return Run("MarketService.SubmitOffer", [&] {
    SubmitOfferResponse resp;
    ToProto(ctx_.engine->SubmitOffer(*ctx_.market, req.listing_id(), req.offerer_id(), req.amount()),
            resp.mutable_outcome());
    return resp;
  });
}

AcceptCounterResponse MarketService::AcceptCounter(const AcceptCounterRequest& req) {
  return Run("MarketService.AcceptCounter", [&] {
    AcceptCounterResponse resp;
    ToProto(ctx_.engine->AcceptCounter(*ctx_.market, req.listing_id(), req.buyer_id()), resp.mutable_outcome());
    return resp;
  });
}

StandFirmResponse MarketService::StandFirm(const StandFirmRequest& req) {
  return Run("MarketService.StandFirm", [&] {
    StandFirmResponse resp;
    ToProto(ctx_.engine->StandFirm(*ctx_.market, req.listing_id(), req.buyer_id()), resp.mutable_outcome());
    return resp;
  });
}

// ---------------------------------------------------------------------
// Disposition
// ---------------------------------------------------------------------

ListForSaleResponse MarketService::ListForSale(const ListForSaleRequest& req) {
  return Run("MarketService.ListForSale", [&] {
    ListForSaleResponse resp;
    auto sale = ctx_.engine->ListForSale(*ctx_.market, req.owner_id(), FromProto(req.item()), req.agent_tier());
    ToProto(*ctx_.market, sale, resp.mutable_sale());
    return resp;
  });
}

CancelSaleResponse MarketService::CancelSale(const CancelSaleRequest& req) {
  return Run("MarketService.CancelSale", [&] {
    CancelSaleResponse resp;
    auto result = ctx_.engine->CancelSale(*ctx_.market, req.sale_id(), req.owner_id());
    ToProto(*ctx_.market, result.sale, resp.mutable_sale());
    ToProto(result.returned_item, resp.mutable_returned_item());
    return resp;
  });
}

AcceptOfferResponse MarketService::AcceptOffer(const AcceptOfferRequest& req) {
  return Run("MarketService.AcceptOffer", [&] {
    AcceptOfferResponse resp;
    auto result = ctx_.engine->AcceptOffer(*ctx_.market, req.listing_id(), req.owner_id());
    ToProto(*ctx_.market, result.sale, resp.mutable_sale());
    resp.set_proceeds(result.proceeds);
    return resp;
  });
}

DeclineOfferResponse MarketService::DeclineOffer(const DeclineOfferRequest& req) {
  return Run("MarketService.DeclineOffer", [&] {
    DeclineOfferResponse resp;
    ToProto(*ctx_.market, ctx_.engine->DeclineOffer(*ctx_.market, req.listing_id(), req.owner_id()),
            resp.mutable_sale());
    return resp;
  });
}

ModifySaleAskingPriceResponse MarketService::ModifySaleAskingPrice(const ModifySaleAskingPriceRequest& req) {
  return Run("MarketService.ModifySaleAskingPrice", [&] {
    ModifySaleAskingPriceResponse resp;
    auto sale = ctx_.engine->ModifySaleAskingPrice(*ctx_.market, req.sale_id(), req.owner_id(), req.asking_price());
    ToProto(*ctx_.market, sale, resp.mutable_sale());
    return resp;
  });
}

GetActiveListingsResponse MarketService::GetActiveListings(const GetActiveListingsRequest& req) {
  return Run("MarketService.GetActiveListings", [&] {
    GetActiveListingsResponse resp;
    for (const auto& view : ctx_.engine->GetActiveListings(*ctx_.market, req.requester_id())) {
      ToProto(view, resp.add_listings());
    }
    for (const auto& sale : ctx_.engine->GetSales(*ctx_.market, req.requester_id())) {
      ToProto(*ctx_.market, sale, resp.add_sales());
    }
    return resp;
  });
}

// ---------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------

RequestInspectionResponse MarketService::RequestInspection(const RequestInspectionRequest& req) {
  return Run("MarketService.RequestInspection", [&] {
    RequestInspectionResponse resp;
    auto record = ctx_.engine->RequestInspection(*ctx_.market, req.listing_id(), req.requester_id(), req.tier());
    ToProto(*ctx_.market, record, resp.mutable_inspection());
    return resp;
  });
}

CancelInspectionResponse MarketService::CancelInspection(const CancelInspectionRequest& req) {
  return Run("MarketService.CancelInspection", [&] {
    CancelInspectionResponse resp;
    auto record = ctx_.engine->CancelInspection(*ctx_.market, req.listing_id(), req.requester_id());
    ToProto(*ctx_.market, record, resp.mutable_inspection());
    return resp;
  });
}

GetInspectionResponse MarketService::GetInspection(const GetInspectionRequest& req) {
  return Run("MarketService.GetInspection", [&] {
    GetInspectionResponse resp;
    ToProto(*ctx_.market, ctx_.engine->GetInspection(*ctx_.market, req.listing_id()), resp.mutable_inspection());
    return resp;
  });
}

GetHoursRemainingResponse MarketService::GetHoursRemaining(const GetHoursRemainingRequest& req) {
  return Run("MarketService.GetHoursRemaining", [&] {
    GetHoursRemainingResponse resp;
    resp.set_hours(ctx_.engine->GetHoursRemaining(*ctx_.market, req.id()));
    return resp;
  });
}

// ---------------------------------------------------------------------
// Clock, snapshots, notifications
// ---------------------------------------------------------------------

HourTickResponse MarketService::HourTick(const HourTickRequest& req) {
  return Run("MarketService.HourTick", [&] {
    HourTickResponse resp;
    ctx_.engine->OnHourTick(*ctx_.market, req.hour());
    resp.set_hour(ctx_.market->clock.Now());
    DrainInto(*ctx_.notifications, resp);
    return resp;
  });
}

PeriodTickResponse MarketService::PeriodTick(const PeriodTickRequest& req) {
  return Run("MarketService.PeriodTick", [&] {
    PeriodTickResponse resp;
    ctx_.engine->OnPeriodTick(*ctx_.market, req.period());
    resp.set_period(ctx_.market->clock.Period());
    DrainInto(*ctx_.notifications, resp);
    return resp;
  });
}

SaveSnapshotResponse MarketService::SaveSnapshot(const SaveSnapshotRequest&) {
  return Run("MarketService.SaveSnapshot", [&] {
    if (!ctx_.snapshots) throw std::runtime_error("snapshots are not configured");
    SaveSnapshotResponse resp;
    resp.set_records_written(ctx_.snapshots->Save(*ctx_.market));
    return resp;
  });
}

LoadSnapshotResponse MarketService::LoadSnapshot(const LoadSnapshotRequest&) {
  return Run("MarketService.LoadSnapshot", [&] {
    if (!ctx_.snapshots) throw std::runtime_error("snapshots are not configured");
    persistence::LoadReport report;
    if (!ctx_.snapshots->Load(*ctx_.market, &report)) {
      throw util::NotFound("no snapshot has been saved");
    }
    LoadSnapshotResponse resp;
    resp.set_records_loaded(report.loaded);
    resp.set_records_skipped(report.skipped);
    return resp;
  });
}

DrainNotificationsResponse MarketService::DrainNotifications(const DrainNotificationsRequest&) {
  return Run("MarketService.DrainNotifications", [&] {
    DrainNotificationsResponse resp;
    DrainInto(*ctx_.notifications, resp);
    return resp;
  });
}

} // namespace usedgear::service
