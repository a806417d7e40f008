#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "usedgear/market/v1/market_service.grpc.pb.h"
#include "internal/service/market_service.hpp"

namespace usedgear::grpc {

class MarketServer final : public usedgear::market::v1::MarketService::Service {
public:
  explicit MarketServer(std::shared_ptr<usedgear::service::MarketService> svc);

  ::grpc::Status RequestSearch(::grpc::ServerContext*,
                     const usedgear::market::v1::RequestSearchRequest*,
                     usedgear::market::v1::RequestSearchResponse*) override;
  ::grpc::Status RenewSearch(::grpc::ServerContext*,
                     const usedgear::market::v1::RenewSearchRequest*,
                     usedgear::market::v1::RenewSearchResponse*) override;
  ::grpc::Status CancelSearch(::grpc::ServerContext*,
                     const usedgear::market::v1::CancelSearchRequest*,
                     usedgear::market::v1::CancelSearchResponse*) override;
  ::grpc::Status GetActiveSearches(::grpc::ServerContext*,
                     const usedgear::market::v1::GetActiveSearchesRequest*,
                     usedgear::market::v1::GetActiveSearchesResponse*) override;
  ::grpc::Status ViewListing(::grpc::ServerContext*,
                     const usedgear::market::v1::ViewListingRequest*,
                     usedgear::market::v1::ViewListingResponse*) override;
  ::grpc::Status PurchaseListing(::grpc::ServerContext*,
                     const usedgear::market::v1::PurchaseListingRequest*,
                     usedgear::market::v1::PurchaseListingResponse*) override;
  ::grpc::Status SubmitOffer(::grpc::ServerContext*,
                     const usedgear::market::v1::SubmitOfferRequest*,
                     usedgear::market::v1::SubmitOfferResponse*) override;
  ::grpc::Status AcceptCounter(::grpc::ServerContext*,
                     const usedgear::market::v1::AcceptCounterRequest*,
                     usedgear::market::v1::AcceptCounterResponse*) override;
  ::grpc::Status StandFirm(::grpc::ServerContext*,
                     const usedgear::market::v1::StandFirmRequest*,
                     usedgear::market::v1::StandFirmResponse*) override;
  ::grpc::Status ListForSale(::grpc::ServerContext*,
                     const usedgear::market::v1::ListForSaleRequest*,
                     usedgear::market::v1::ListForSaleResponse*) override;
  ::grpc::Status CancelSale(::grpc::ServerContext*,
                     const usedgear::market::v1::CancelSaleRequest*,
                     usedgear::market::v1::CancelSaleResponse*) override;
  ::grpc::Status AcceptOffer(::grpc::ServerContext*,
                     const usedgear::market::v1::AcceptOfferRequest*,
                     usedgear::market::v1::AcceptOfferResponse*) override;
  ::grpc::Status DeclineOffer(::grpc::ServerContext*,
                     const usedgear::market::v1::DeclineOfferRequest*,
                     usedgear::market::v1::DeclineOfferResponse*) override;
  ::grpc::Status ModifySaleAskingPrice(::grpc::ServerContext*,
                     const usedgear::market::v1::ModifySaleAskingPriceRequest*,
                     usedgear::market::v1::ModifySaleAskingPriceResponse*) override;
  ::grpc::Status GetActiveListings(::grpc::ServerContext*,
                     const usedgear::market::v1::GetActiveListingsRequest*,
                     usedgear::market::v1::GetActiveListingsResponse*) override;
  ::grpc::Status RequestInspection(::grpc::ServerContext*,
                     const usedgear::market::v1::RequestInspectionRequest*,
                     usedgear::market::v1::RequestInspectionResponse*) override;
  ::grpc::Status CancelInspection(::grpc::ServerContext*,
                     const usedgear::market::v1::CancelInspectionRequest*,
                     usedgear::market::v1::CancelInspectionResponse*) override;
  ::grpc::Status GetInspection(::grpc::ServerContext*,
                     const usedgear::market::v1::GetInspectionRequest*,
                     usedgear::market::v1::GetInspectionResponse*) override;
  ::grpc::Status GetHoursRemaining(::grpc::ServerContext*,
                     const usedgear::market::v1::GetHoursRemainingRequest*,
                     usedgear::market::v1::GetHoursRemainingResponse*) override;
  ::grpc::Status HourTick(::grpc::ServerContext*,
                     const usedgear::market::v1::HourTickRequest*,
                     usedgear::market::v1::HourTickResponse*) override;
  ::grpc::Status PeriodTick(::grpc::ServerContext*,
                     const usedgear::market::v1::PeriodTickRequest*,
                     usedgear::market::v1::PeriodTickResponse*) override;
  ::grpc::Status SaveSnapshot(::grpc::ServerContext*,
                     const usedgear::market::v1::SaveSnapshotRequest*,
                     usedgear::market::v1::SaveSnapshotResponse*) override;
  ::grpc::Status LoadSnapshot(::grpc::ServerContext*,
                     const usedgear::market::v1::LoadSnapshotRequest*,
                     usedgear::market::v1::LoadSnapshotResponse*) override;
  ::grpc::Status DrainNotifications(::grpc::ServerContext*,
                     const usedgear::market::v1::DrainNotificationsRequest*,
                     usedgear::market::v1::DrainNotificationsResponse*) override;

private:
  std::shared_ptr<usedgear::service::MarketService> service_;
};

}
