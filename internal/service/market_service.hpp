#pragma once

#include <mutex>

#include "service_context.hpp"
#include "usedgear/market/v1.hpp"

namespace usedgear::service {

/*
  Protobuf-facing adapter over MarketEngine.

  Every call is serialized on one mutex: the market context is not
  thread-safe and ticks must not interleave with player actions. Errors
  are logged and rethrown unchanged for the transport to translate.
*/
class MarketService {
 public:
  explicit MarketService(ServiceContext ctx);

  usedgear::market::v1::RequestSearchResponse RequestSearch(const usedgear::market::v1::RequestSearchRequest& req);
  usedgear::market::v1::RenewSearchResponse   RenewSearch(const usedgear::market::v1::RenewSearchRequest& req);
  usedgear::market::v1::CancelSearchResponse  CancelSearch(const usedgear::market::v1::CancelSearchRequest& req);
  usedgear::market::v1::GetActiveSearchesResponse
  GetActiveSearches(const usedgear::market::v1::GetActiveSearchesRequest& req);

  usedgear::market::v1::ViewListingResponse ViewListing(const usedgear::market::v1::ViewListingRequest& req);
  usedgear::market::v1::PurchaseListingResponse
  PurchaseListing(const usedgear::market::v1::PurchaseListingRequest& req);
  usedgear::market::v1::SubmitOfferResponse   SubmitOffer(const usedgear::market::v1::SubmitOfferRequest& req);
  usedgear::market::v1::AcceptCounterResponse AcceptCounter(const usedgear::market::v1::AcceptCounterRequest& req);
  usedgear::market::v1::StandFirmResponse     StandFirm(const usedgear::market::v1::StandFirmRequest& req);

  usedgear::market::v1::ListForSaleResponse  ListForSale(const usedgear::market::v1::ListForSaleRequest& req);
  usedgear::market::v1::CancelSaleResponse   CancelSale(const usedgear::market::v1::CancelSaleRequest& req);
  usedgear::market::v1::AcceptOfferResponse  AcceptOffer(const usedgear::market::v1::AcceptOfferRequest& req);
  usedgear::market::v1::DeclineOfferResponse DeclineOffer(const usedgear::market::v1::DeclineOfferRequest& req);
  usedgear::market::v1::ModifySaleAskingPriceResponse
  ModifySaleAskingPrice(const usedgear::market::v1::ModifySaleAskingPriceRequest& req);
  usedgear::market::v1::GetActiveListingsResponse
  GetActiveListings(const usedgear::market::v1::GetActiveListingsRequest& req);

  usedgear::market::v1::RequestInspectionResponse
  RequestInspection(const usedgear::market::v1::RequestInspectionRequest& req);
  usedgear::market::v1::CancelInspectionResponse
  CancelInspection(const usedgear::market::v1::CancelInspectionRequest& req);
  usedgear::market::v1::GetInspectionResponse GetInspection(const usedgear::market::v1::GetInspectionRequest& req);

  usedgear::market::v1::GetHoursRemainingResponse
  GetHoursRemaining(const usedgear::market::v1::GetHoursRemainingRequest& req);

  usedgear::market::v1::HourTickResponse   HourTick(const usedgear::market::v1::HourTickRequest& req);
  usedgear::market::v1::PeriodTickResponse PeriodTick(const usedgear::market::v1::PeriodTickRequest& req);

  usedgear::market::v1::SaveSnapshotResponse SaveSnapshot(const usedgear::market::v1::SaveSnapshotRequest& req);
  usedgear::market::v1::LoadSnapshotResponse LoadSnapshot(const usedgear::market::v1::LoadSnapshotRequest& req);
  usedgear::market::v1::DrainNotificationsResponse
  DrainNotifications(const usedgear::market::v1::DrainNotificationsRequest& req);

 private:
  template <typename Fn>
  auto Run(const char* route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
  std::mutex     mutex_;
};

} // namespace usedgear::service
