#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/market_engine.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/market_server.hpp"
#include "internal/service/market_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/market_fixture.hpp"
#include "usedgear/market/v1.hpp"

namespace {

using namespace usedgear::market::v1;
using usedgear::testing::TestMarket;

constexpr const char* kPlayer = "player-1";

struct Fixture {
  explicit Fixture(double starting_balance = 1'000'000.0)
      : market(std::make_shared<TestMarket>(42, starting_balance)) {
    usedgear::service::ServiceContext ctx;
    ctx.engine        = std::make_shared<usedgear::core::MarketEngine>();
    ctx.market        = std::shared_ptr<usedgear::market::MarketContext>(market, &market->ctx);
    ctx.notifications = market->notifications;
    server = std::make_unique<usedgear::grpc::MarketServer>(std::make_shared<usedgear::service::MarketService>(ctx));
  }

  std::shared_ptr<TestMarket>                   market;
  std::unique_ptr<usedgear::grpc::MarketServer> server;
};

RequestSearchRequest SearchRequest() {
  RequestSearchRequest req;
  req.set_requester_id(kPlayer);
  req.mutable_category()->set_id("excavator");
  req.mutable_category()->set_base_price(100000.0);
  req.set_quality_tier(3);
  req.set_agent_tier(2);
  return req;
}

void TestPurchaseMissingListingReturnsNotFound() {
  Fixture f;

  PurchaseListingRequest req;
  req.set_listing_id("LISTING_00000404");
  req.set_buyer_id(kPlayer);
  PurchaseListingResponse resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = f.server->PurchaseListing(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSearchLimitReturnsResourceExhausted() {
  Fixture f;

  for (int i = 0; i < 5; ++i) {
    RequestSearchResponse resp;
    ::grpc::ServerContext grpc_ctx;
    const auto req = SearchRequest();
    assert(f.server->RequestSearch(&grpc_ctx, &req, &resp).ok());
  }

  RequestSearchResponse resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            req    = SearchRequest();
  const auto            status = f.server->RequestSearch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestNegativeOfferReturnsInvalidArgument() {
  Fixture    f;
  const auto id = f.market->AddFoundListing(kPlayer, 60000.0).id;

  SubmitOfferRequest req;
  req.set_listing_id(id);
  req.set_offerer_id(kPlayer);
  req.set_amount(-1.0);
  SubmitOfferResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server->SubmitOffer(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnaffordableSearchReturnsFailedPrecondition() {
  Fixture f(10.0);

  RequestSearchResponse resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            req    = SearchRequest();
  const auto            status = f.server->RequestSearch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestSecondPurchaseReturnsAborted() {
  Fixture    f;
  const auto id = f.market->AddFoundListing(kPlayer, 60000.0).id;

  PurchaseListingRequest req;
  req.set_listing_id(id);
  req.set_buyer_id(kPlayer);

  {
    PurchaseListingResponse resp;
    ::grpc::ServerContext   grpc_ctx;
    assert(f.server->PurchaseListing(&grpc_ctx, &req, &resp).ok());
    assert(resp.price_paid() == 60000.0);
  }

  PurchaseListingResponse resp;
  ::grpc::ServerContext   grpc_ctx;
  const auto              status = f.server->PurchaseListing(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
}

void TestSnapshotWithoutStoreReturnsInternal() {
  Fixture f;

  SaveSnapshotRequest   req;
  SaveSnapshotResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            status = f.server->SaveSnapshot(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestCorruptRecordMapsToDataLoss() {
  const auto status = usedgear::grpc::ToStatus(usedgear::util::CorruptRecordError("listing LISTING_1: bad number"));
  assert(status.error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(status.error_message() == "listing LISTING_1: bad number");
}

} // namespace

int main() {
  TestPurchaseMissingListingReturnsNotFound();
  TestSearchLimitReturnsResourceExhausted();
  TestNegativeOfferReturnsInvalidArgument();
  TestUnaffordableSearchReturnsFailedPrecondition();
  TestSecondPurchaseReturnsAborted();
  TestSnapshotWithoutStoreReturnsInternal();
  TestCorruptRecordMapsToDataLoss();

  std::cout << "usedgear_unit_grpc_status: pass\n";
  return 0;
}
