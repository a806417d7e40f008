#include "market_server.hpp"

#include "grpc_error.hpp"
#include "usedgear/market/v1.hpp"

namespace usedgear::grpc {

using namespace usedgear::market::v1;

MarketServer::MarketServer(std::shared_ptr<usedgear::service::MarketService> svc) : service_(std::move(svc)) {
}

::grpc::Status MarketServer::RequestSearch(::grpc::ServerContext*, const RequestSearchRequest* req, RequestSearchResponse* resp) {
  try {
    *resp = service_->RequestSearch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::RenewSearch(::grpc::ServerContext*, const RenewSearchRequest* req, RenewSearchResponse* resp) {
  try {
    *resp = service_->RenewSearch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::CancelSearch(::grpc::ServerContext*, const CancelSearchRequest* req, CancelSearchResponse* resp) {
  try {
    *resp = service_->CancelSearch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::GetActiveSearches(::grpc::ServerContext*, const GetActiveSearchesRequest* req, GetActiveSearchesResponse* resp) {
  try {
    *resp = service_->GetActiveSearches(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::ViewListing(::grpc::ServerContext*, const ViewListingRequest* req, ViewListingResponse* resp) {
  try {
    *resp = service_->ViewListing(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::PurchaseListing(::grpc::ServerContext*, const PurchaseListingRequest* req, PurchaseListingResponse* resp) {
  try {
    *resp = service_->PurchaseListing(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::SubmitOffer(::grpc::ServerContext*, const SubmitOfferRequest* req, SubmitOfferResponse* resp) {
  try {
    *resp = service_->SubmitOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::AcceptCounter(::grpc::ServerContext*, const AcceptCounterRequest* req, AcceptCounterResponse* resp) {
  try {
    *resp = service_->AcceptCounter(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::StandFirm(::grpc::ServerContext*, const StandFirmRequest* req, StandFirmResponse* resp) {
  try {
    *resp = service_->StandFirm(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::ListForSale(::grpc::ServerContext*, const ListForSaleRequest* req, ListForSaleResponse* resp) {
  try {
    *resp = service_->ListForSale(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::CancelSale(::grpc::ServerContext*, const CancelSaleRequest* req, CancelSaleResponse* resp) {
  try {
    *resp = service_->CancelSale(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::AcceptOffer(::grpc::ServerContext*, const AcceptOfferRequest* req, AcceptOfferResponse* resp) {
  try {
    *resp = service_->AcceptOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::DeclineOffer(::grpc::ServerContext*, const DeclineOfferRequest* req, DeclineOfferResponse* resp) {
  try {
    *resp = service_->DeclineOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::ModifySaleAskingPrice(::grpc::ServerContext*, const ModifySaleAskingPriceRequest* req, ModifySaleAskingPriceResponse* resp) {
  try {
    *resp = service_->ModifySaleAskingPrice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::GetActiveListings(::grpc::ServerContext*, const GetActiveListingsRequest* req, GetActiveListingsResponse* resp) {
  try {
    *resp = service_->GetActiveListings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::RequestInspection(::grpc::ServerContext*, const RequestInspectionRequest* req, RequestInspectionResponse* resp) {
  try {
    *resp = service_->RequestInspection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::CancelInspection(::grpc::ServerContext*, const CancelInspectionRequest* req, CancelInspectionResponse* resp) {
  try {
    *resp = service_->CancelInspection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::GetInspection(::grpc::ServerContext*, const GetInspectionRequest* req, GetInspectionResponse* resp) {
  try {
    *resp = service_->GetInspection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::GetHoursRemaining(::grpc::ServerContext*, const GetHoursRemainingRequest* req, GetHoursRemainingResponse* resp) {
  try {
    *resp = service_->GetHoursRemaining(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::HourTick(::grpc::ServerContext*, const HourTickRequest* req, HourTickResponse* resp) {
  try {
    *resp = service_->HourTick(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::PeriodTick(::grpc::ServerContext*, const PeriodTickRequest* req, PeriodTickResponse* resp) {
  try {
    *resp = service_->PeriodTick(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::SaveSnapshot(::grpc::ServerContext*, const SaveSnapshotRequest* req, SaveSnapshotResponse* resp) {
  try {
    *resp = service_->SaveSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::LoadSnapshot(::grpc::ServerContext*, const LoadSnapshotRequest* req, LoadSnapshotResponse* resp) {
  try {
    *resp = service_->LoadSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MarketServer::DrainNotifications(::grpc::ServerContext*, const DrainNotificationsRequest* req, DrainNotificationsResponse* resp) {
  try {
    *resp = service_->DrainNotifications(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace usedgear::grpc
