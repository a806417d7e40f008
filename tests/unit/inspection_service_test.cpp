#include "internal/inspection/inspection_service.hpp"

#include <cassert>
#include <iostream>

#include "internal/disposition/disposition_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/market_fixture.hpp"

namespace {

using usedgear::host::Severity;
using usedgear::inspection::InspectionService;
using usedgear::model::ConditionField;
using usedgear::model::InspectionState;
using usedgear::model::InspectionTier;
using usedgear::model::ListingStatus;
using usedgear::testing::TestMarket;

constexpr const char* kPlayer = "player-1";

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestQuickInspectionCompletesAfterTwoHours() {
  TestMarket        market;
  InspectionService service;
  market.ctx.clock.Restore(1000, 41);
  const auto id = market.AddFoundListing(kPlayer, 50000.0).id;

  const auto record = service.Request(market.ctx, id, kPlayer, 1);
  assert(record.tier == InspectionTier::kQuick);
  assert(record.fee_paid == 2000.0);
  assert(record.requested_at_hour == 1000);
  assert(record.completes_at_hour == 1002);
  assert(market.ledger->Balance(kPlayer) == 1'000'000.0 - 2000.0);
  assert(market.ctx.listings.Find(id)->on_hold);
  assert(market.ctx.holds.HasActive(id, 1000));
  assert(InspectionService::HoursRemaining(market.ctx, record) == 2);

  market.ctx.clock.AdvanceTo(1001);
  service.OnHourTick(market.ctx);
  assert(service.Get(market.ctx, id).state == InspectionState::kPending);
  assert(InspectionService::HoursRemaining(market.ctx, service.Get(market.ctx, id)) == 1);
  assert(market.ctx.listings.Find(id)->Revealed().empty());

  market.notifications->Drain();
  market.ctx.clock.AdvanceTo(1002);
  service.OnHourTick(market.ctx);

  const auto& done = service.Get(market.ctx, id);
  assert(done.state == InspectionState::kComplete);
  assert(InspectionService::HoursRemaining(market.ctx, done) == 0);

  const auto* listing = market.ctx.listings.Find(id);
  assert(!listing->on_hold);
  assert(listing->Revealed().size() == 1);
  assert(listing->IsRevealed(ConditionField::kOverallRating));
  assert(market.ctx.holds.Size() == 0);

  const auto notes = market.notifications->Drain();
  assert(notes.size() == 1);
  assert(notes.front().severity == Severity::kOk);
  assert(notes.front().message.find("overall rating 64/100") != std::string::npos);
}

void TestComprehensiveRevealsEverythingAndCapsFee() {
  TestMarket        market;
  InspectionService service;
  const auto        id = market.AddFoundListing(kPlayer, 200000.0, 0.85).id;

  const auto record = service.Request(market.ctx, id, kPlayer, 3);
  assert(record.fee_paid == 10000.0);
  assert(record.completes_at_hour == 12);

  market.ctx.clock.AdvanceTo(12);
  service.OnHourTick(market.ctx);

  const auto* listing = market.ctx.listings.Find(id);
  assert(listing->Revealed().size() == 6);
  assert(listing->IsRevealed(ConditionField::kQualityHint));
  assert(listing->IsRevealed(ConditionField::kReliabilityCeiling));
}

void TestRequestValidation() {
  TestMarket                              market;
  InspectionService                       service;
  usedgear::disposition::DispositionQueue sales;
  const auto id = market.AddFoundListing(kPlayer, 50000.0).id;

  assert(Throws<usedgear::util::ValidationError>([&] { service.Request(market.ctx, id, kPlayer, 0); }));
  assert(Throws<usedgear::util::ValidationError>([&] { service.Request(market.ctx, id, "player-2", 1); }));
  assert(Throws<usedgear::util::NotFound>([&] { service.Request(market.ctx, "LISTING_77777777", kPlayer, 1); }));

  const auto sale = sales.ListForSale(market.ctx, kPlayer, usedgear::testing::Tractor(), 1);
  assert(Throws<usedgear::util::ValidationError>([&] { service.Request(market.ctx, sale.listing_id, kPlayer, 1); }));

  service.Request(market.ctx, id, kPlayer, 2);
  const double balance = market.ledger->Balance(kPlayer);
  assert(Throws<usedgear::util::ValidationError>([&] { service.Request(market.ctx, id, kPlayer, 1); }));
  assert(market.ledger->Balance(kPlayer) == balance);

  market.ctx.clock.AdvanceTo(6);
  service.OnHourTick(market.ctx);
  assert(Throws<usedgear::util::ValidationError>([&] { service.Request(market.ctx, id, kPlayer, 3); }));
}

void TestFeeRequiresFunds() {
  TestMarket        market(42, 500.0);
  InspectionService service;
  const auto        id = market.AddFoundListing(kPlayer, 50000.0).id;

  assert(Throws<usedgear::util::FundsError>([&] { service.Request(market.ctx, id, kPlayer, 1); }));
  assert(market.ctx.inspections.empty());
  assert(market.ctx.holds.Size() == 0);
  assert(!market.ctx.listings.Find(id)->on_hold);
}

void TestCancelReleasesHoldWithoutRefund() {
  TestMarket        market;
  InspectionService service;
  const auto        id = market.AddFoundListing(kPlayer, 50000.0).id;

  service.Request(market.ctx, id, kPlayer, 2);
  const double after_fee = market.ledger->Balance(kPlayer);

  assert(Throws<usedgear::util::ValidationError>([&] { service.Cancel(market.ctx, id, "player-2"); }));

  const auto cancelled = service.Cancel(market.ctx, id, kPlayer);
  assert(cancelled.state == InspectionState::kCancelled);
  assert(market.ledger->Balance(kPlayer) == after_fee);
  assert(!market.ctx.listings.Find(id)->on_hold);
  assert(market.ctx.holds.Size() == 0);

  assert(Throws<usedgear::util::ValidationError>([&] { service.Cancel(market.ctx, id, kPlayer); }));

  // A cancelled inspection can be booked again.
  const auto again = service.Request(market.ctx, id, kPlayer, 1);
  assert(again.state == InspectionState::kPending);
  assert(again.id != cancelled.id);
}

void TestRetiredListingDropsInspection() {
  TestMarket        market;
  InspectionService service;
  const auto        id = market.AddFoundListing(kPlayer, 50000.0).id;

  service.Request(market.ctx, id, kPlayer, 1);
  usedgear::market::RetireListing(market.ctx, id, ListingStatus::kSold);

  assert(market.ctx.holds.Size() == 0);
  assert(Throws<usedgear::util::NotFound>([&] { service.Get(market.ctx, id); }));
  assert(Throws<usedgear::util::RaceRejection>([&] { service.Cancel(market.ctx, id, kPlayer); }));
}

} // namespace

int main() {
  TestQuickInspectionCompletesAfterTwoHours();
  TestComprehensiveRevealsEverythingAndCapsFee();
  TestRequestValidation();
  TestFeeRequiresFunds();
  TestCancelReleasesHoldWithoutRefund();
  TestRetiredListingDropsInspection();

  std::cout << "usedgear_unit_inspection_service: pass\n";
  return 0;
}
