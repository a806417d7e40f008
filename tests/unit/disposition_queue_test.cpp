#include "internal/disposition/disposition_queue.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/market_fixture.hpp"

namespace {

using usedgear::disposition::DispositionQueue;
using usedgear::market::MarketTables;
using usedgear::model::AgentTier;
using usedgear::model::ListingOrigin;
using usedgear::model::ListingStatus;
using usedgear::model::SaleStatus;
using usedgear::testing::TestMarket;
using usedgear::testing::Tractor;

constexpr const char* kOwner = "farmer-1";

MarketTables AlwaysFindsBuyer() {
  auto tables = MarketTables::Defaults();
  for (auto& spec : tables.sale) spec.success_chance = 1.0;
  return tables;
}

MarketTables NeverFindsBuyer() {
  auto tables = MarketTables::Defaults();
  for (auto& spec : tables.sale) spec.success_chance = 0.0;
  return tables;
}

void TestListForSaleCreatesListing() {
  TestMarket       market;
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  assert(sale.fee_paid == 50.0);
  assert(sale.agent_tier == AgentTier::kLocal);
  assert(sale.status == SaleStatus::kSearching);
  assert(sale.expected_min == 24000.0);
  assert(sale.expected_max == 30000.0);
  assert(sale.hours_until_cycle == 12);
  assert(market.ledger->Balance(kOwner) == 1'000'000.0 - 50.0);

  const auto* listing = market.ctx.listings.Find(sale.listing_id);
  assert(listing != nullptr);
  assert(listing->origin == ListingOrigin::kSale);
  assert(listing->status == ListingStatus::kSearching);
  assert(listing->source_id == sale.id);
  assert(listing->ttl_hours == 72);
  assert(listing->viewed);
  assert(listing->condition.operating_hours == 3400);
}

void TestListForSaleRejectsBadInput() {
  TestMarket       market;
  DispositionQueue queue;

  bool threw = false;
  try {
    queue.ListForSale(market.ctx, kOwner, Tractor(), 4);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.ListForSale(market.ctx, kOwner, Tractor(0.0), 1);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ledger->Balance(kOwner) == 1'000'000.0);

  queue.ListForSale(market.ctx, kOwner, Tractor(), 2);
  threw = false;
  try {
    queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.sales.size() == 1);
}

void TestAgentFeeNeedsFunds() {
  TestMarket       market(42, 100.0);
  DispositionQueue queue;

  bool threw = false;
  try {
    queue.ListForSale(market.ctx, kOwner, Tractor(), 3);
  } catch (const usedgear::util::FundsError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.Live().empty());
  assert(market.ledger->Balance(kOwner) == 100.0);
}

void TestCancelKeepsAgentFee() {
  TestMarket       market;
  DispositionQueue queue;

  const auto sale   = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  const auto result = queue.CancelSale(market.ctx, sale.id, kOwner);

  assert(result.sale.status == SaleStatus::kCancelled);
  assert(result.returned_item.item_id == "ITEM_TRACTOR");
  assert(market.ledger->Balance(kOwner) == 1'000'000.0 - 50.0);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.TombstoneFor(sale.listing_id)->status == ListingStatus::kWithdrawn);

  bool threw = false;
  try {
    queue.CancelSale(market.ctx, sale.id, kOwner);
  } catch (const usedgear::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestOfferArrivesEachCycleAndLapses() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);

  queue.OnHourTick(market.ctx, 11);
  assert(market.ctx.sales.at(sale.id).status == SaleStatus::kSearching);

  queue.OnHourTick(market.ctx, 1);
  {
    const auto& live = market.ctx.sales.at(sale.id);
    assert(live.status == SaleStatus::kOfferPending);
    assert(live.pending_offer.has_value());
    assert(live.pending_offer->amount >= 24000.0 && live.pending_offer->amount <= 30000.0);
    assert(live.pending_offer_hours_remaining == 24);
    assert(live.offers_received == 1);
    assert(market.ctx.listings.Find(sale.listing_id)->status == ListingStatus::kNegotiating);
  }

  queue.OnHourTick(market.ctx, 23);
  assert(market.ctx.sales.at(sale.id).status == SaleStatus::kOfferPending);

  queue.OnHourTick(market.ctx, 1);
  const auto& lapsed = market.ctx.sales.at(sale.id);
  assert(lapsed.status == SaleStatus::kSearching);
  assert(!lapsed.pending_offer.has_value());
  assert(lapsed.offers.size() == 1);
  assert(!lapsed.offers.front().accepted);
  assert(lapsed.offers_declined == 1);
  assert(lapsed.hours_until_cycle == 12);
  assert(market.ctx.listings.Find(sale.listing_id)->ttl_hours == 72 - 36);
}

void TestAcceptOfferPaysOwner() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  queue.OnHourTick(market.ctx, 12);
  const double amount = market.ctx.sales.at(sale.id).pending_offer->amount;

  const auto result = queue.AcceptOffer(market.ctx, sale.listing_id, kOwner);
  assert(result.proceeds == amount);
  assert(result.sale.status == SaleStatus::kSold);
  assert(result.sale.offers.back().accepted);
  assert(market.ledger->Balance(kOwner) == 1'000'000.0 - 50.0 + amount);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.TombstoneFor(sale.listing_id)->status == ListingStatus::kSold);

  bool raced = false;
  try {
    queue.AcceptOffer(market.ctx, sale.listing_id, kOwner);
  } catch (const usedgear::util::RaceRejection&) {
    raced = true;
  }
  assert(raced);
}

void TestDeclineOfferResumesSearch() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);

  bool threw = false;
  try {
    queue.DeclineOffer(market.ctx, sale.listing_id, kOwner);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  queue.OnHourTick(market.ctx, 12);
  const auto declined = queue.DeclineOffer(market.ctx, sale.listing_id, kOwner);
  assert(declined.status == SaleStatus::kSearching);
  assert(declined.offers_declined == 1);
  assert(market.ctx.listings.Find(sale.listing_id)->status == ListingStatus::kSearching);
  assert(market.ledger->Balance(kOwner) == 1'000'000.0 - 50.0);
}

void TestUnsoldListingExpires() {
  TestMarket       market(7, 1'000'000.0, NeverFindsBuyer());
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  queue.OnHourTick(market.ctx, 71);
  assert(market.ctx.sales.count(sale.id) == 1);

  market.notifications->Drain();
  queue.OnHourTick(market.ctx, 1);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.TombstoneFor(sale.listing_id)->status == ListingStatus::kExpired);
  assert(market.notifications->Pending() == 1);
}

// Declines the offers at hours 12 to 48 so the hour-60 offer is the one
// left pending as the 72h lifetime runs out.
std::string SaleWithLateOffer(TestMarket& market, DispositionQueue& queue) {
  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);
  for (int cycle = 0; cycle < 4; ++cycle) {
    queue.OnHourTick(market.ctx, 12);
    queue.DeclineOffer(market.ctx, sale.listing_id, kOwner);
  }
  queue.OnHourTick(market.ctx, 12);
  assert(market.ctx.sales.at(sale.id).status == SaleStatus::kOfferPending);
  assert(market.ctx.listings.Find(sale.listing_id)->ttl_hours == 12);
  return sale.id;
}

void TestPendingOfferOutlivesListingLifetime() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto  sale_id    = SaleWithLateOffer(market, queue);
  const auto  listing_id = market.ctx.sales.at(sale_id).listing_id;
  const double amount    = market.ctx.sales.at(sale_id).pending_offer->amount;

  queue.OnHourTick(market.ctx, 12);
  queue.OnHourTick(market.ctx, 11);
  assert(market.ctx.sales.count(sale_id) == 1);
  assert(market.ctx.sales.at(sale_id).status == SaleStatus::kOfferPending);
  assert(market.ctx.sales.at(sale_id).pending_offer_hours_remaining == 1);
  assert(market.ctx.listings.Find(listing_id)->ttl_hours == 0);

  const auto result = queue.AcceptOffer(market.ctx, listing_id, kOwner);
  assert(result.proceeds == amount);
  assert(market.ctx.listings.TombstoneFor(listing_id)->status == ListingStatus::kSold);
}

void TestLapsedOfferAfterLifetimeExpiresSale() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale_id    = SaleWithLateOffer(market, queue);
  const auto listing_id = market.ctx.sales.at(sale_id).listing_id;

  queue.OnHourTick(market.ctx, 24);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.TombstoneFor(listing_id)->status == ListingStatus::kExpired);
}

void TestDeclineAfterLifetimeExpiresSale() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale_id    = SaleWithLateOffer(market, queue);
  const auto listing_id = market.ctx.sales.at(sale_id).listing_id;

  queue.OnHourTick(market.ctx, 12);
  const auto declined = queue.DeclineOffer(market.ctx, listing_id, kOwner);
  assert(declined.status == SaleStatus::kExpired);
  assert(declined.offers_declined == 5);
  assert(market.ctx.sales.empty());
  assert(market.ctx.listings.TombstoneFor(listing_id)->status == ListingStatus::kExpired);
}

void TestAskingPriceShapesOffers() {
  TestMarket       market(7, 1'000'000.0, AlwaysFindsBuyer());
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 1);

  bool threw = false;
  try {
    queue.ModifyAskingPrice(market.ctx, sale.id, kOwner, 0.0);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  auto updated = queue.ModifyAskingPrice(market.ctx, sale.id, kOwner, 60000.0);
  assert(market.ctx.listings.Find(sale.listing_id)->asking_price == 60000.0);
  assert(std::fabs(DispositionQueue::CycleSuccessChance(market.ctx.tables, updated) - 0.5) < 1e-9);

  updated = queue.ModifyAskingPrice(market.ctx, sale.id, kOwner, 20000.0);
  assert(DispositionQueue::CycleSuccessChance(market.ctx.tables, updated) == 1.0);

  queue.OnHourTick(market.ctx, 12);
  assert(market.ctx.sales.at(sale.id).pending_offer->amount == 20000.0);
}

void TestPeriodTickCountsMonths() {
  TestMarket       market;
  DispositionQueue queue;

  const auto sale = queue.ListForSale(market.ctx, kOwner, Tractor(), 2);
  market.notifications->Drain();

  queue.OnPeriodTick(market.ctx);
  queue.OnPeriodTick(market.ctx);
  assert(market.ctx.sales.at(sale.id).months_listed == 2);
  assert(market.notifications->Pending() == 2);
  assert(queue.Sales(market.ctx, kOwner).size() == 1);
  assert(queue.Sales(market.ctx, "someone-else").empty());
}

} // namespace

int main() {
  TestListForSaleCreatesListing();
  TestListForSaleRejectsBadInput();
  TestAgentFeeNeedsFunds();
  TestCancelKeepsAgentFee();
  TestOfferArrivesEachCycleAndLapses();
  TestAcceptOfferPaysOwner();
  TestDeclineOfferResumesSearch();
  TestUnsoldListingExpires();
  TestPendingOfferOutlivesListingLifetime();
  TestLapsedOfferAfterLifetimeExpiresSale();
  TestDeclineAfterLifetimeExpiresSale();
  TestAskingPriceShapesOffers();
  TestPeriodTickCountsMonths();

  std::cout << "usedgear_unit_disposition_queue: pass\n";
  return 0;
}
