#include "internal/acquisition/acquisition_queue.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/market_fixture.hpp"

namespace {

using usedgear::acquisition::AcquisitionQueue;
using usedgear::host::Severity;
using usedgear::model::ListingStatus;
using usedgear::model::OutcomeKind;
using usedgear::model::SearchStatus;
using usedgear::testing::Excavator;
using usedgear::testing::TestMarket;

constexpr const char* kPlayer = "player-1";

bool HasWarning(TestMarket& market) {
  for (const auto& note : market.notifications->Drain()) {
    if (note.severity == Severity::kWarning || note.severity == Severity::kCritical) return true;
  }
  return false;
}

void TestActiveSearchLimit() {
  TestMarket       market;
  AcquisitionQueue queue;

  for (int i = 0; i < 5; ++i) {
    const auto search = queue.RequestSearch(market.ctx, kPlayer, Excavator(), 4, 2);
    assert(search.status == SearchStatus::kActive);
    assert(search.fee_paid == 1500.0);
  }
  const double balance = market.ledger->Balance(kPlayer);
  assert(balance == 1'000'000.0 - 5 * 1500.0);
  market.notifications->Drain();

  bool threw = false;
  try {
    queue.RequestSearch(market.ctx, kPlayer, Excavator(), 4, 2);
  } catch (const usedgear::util::LimitExceeded&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.searches.size() == 5);
  assert(market.ledger->Balance(kPlayer) == balance);
  assert(HasWarning(market));

  // Limits are per requester.
  queue.RequestSearch(market.ctx, "player-2", Excavator(), 4, 2);
  assert(market.ctx.searches.size() == 6);
}

void TestInsufficientFundsChangesNothing() {
  TestMarket       market(42, 100.0);
  AcquisitionQueue queue;

  bool threw = false;
  try {
    queue.RequestSearch(market.ctx, kPlayer, Excavator(), 3, 1);
  } catch (const usedgear::util::FundsError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.searches.empty());
  assert(market.ctx.ids.Counter() == 0);
  assert(market.ledger->Balance(kPlayer) == 100.0);
  assert(HasWarning(market));
}

void TestInvalidCategoryRejected() {
  TestMarket       market;
  AcquisitionQueue queue;

  bool threw = false;
  try {
    queue.RequestSearch(market.ctx, kPlayer, Excavator(0.0), 3, 1);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ledger->Balance(kPlayer) == 1'000'000.0);
}

void TestSearchResolvesIntoFoundListings() {
  bool saw_success = false;
  bool saw_failure = false;

  for (std::uint64_t seed = 1; seed <= 40 && !(saw_success && saw_failure); ++seed) {
    TestMarket       market(seed);
    AcquisitionQueue queue;

    const auto search = queue.RequestSearch(market.ctx, kPlayer, Excavator(), 2, 2);
    assert(search.ttl_hours == 24 || search.ttl_hours == 48);

    market.ctx.clock.AdvanceTo(search.ttl_hours - 1);
    queue.OnHourTick(market.ctx, search.ttl_hours - 1);
    assert(market.ctx.searches.at(search.id).status == SearchStatus::kActive);

    market.ctx.clock.AdvanceTo(search.ttl_hours);
    queue.OnHourTick(market.ctx, 1);

    auto it = market.ctx.searches.find(search.id);
    assert(it != market.ctx.searches.end());
    if (it->second.status == SearchStatus::kFailed) {
      saw_failure = true;
      assert(it->second.result_ids.empty());
      assert(it->second.ttl_hours == 72);
      assert(market.ctx.listings.Live().empty());
      continue;
    }

    saw_success = true;
    assert(it->second.status == SearchStatus::kSucceeded);
    assert(it->second.result_ids.size() == 2);
    for (const auto& id : it->second.result_ids) {
      const auto* listing = market.ctx.listings.Find(id);
      assert(listing != nullptr);
      assert(listing->status == ListingStatus::kFound);
      assert(listing->owner_id == kPlayer);
      assert(listing->ttl_hours == 72);
      assert(!listing->viewed);
      assert(listing->asking_price > listing->price);
      assert(listing->negotiation.has_value());
    }
  }

  assert(saw_success);
  assert(saw_failure);
}

void TestFoundListingWindowStartsWhenViewed() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       id = market.AddFoundListing(kPlayer, 50000.0).id;

  queue.OnHourTick(market.ctx, 10);
  assert(market.ctx.listings.Find(id)->ttl_hours == 72);

  const auto view = queue.ViewListing(market.ctx, id, kPlayer);
  assert(view.viewed);

  queue.OnHourTick(market.ctx, 10);
  assert(market.ctx.listings.Find(id)->ttl_hours == 62);

  market.ctx.listings.Find(id)->on_hold = true;
  queue.OnHourTick(market.ctx, 30);
  assert(market.ctx.listings.Find(id)->ttl_hours == 62);

  market.ctx.listings.Find(id)->on_hold = false;
  queue.OnHourTick(market.ctx, 61);
  assert(market.ctx.listings.Find(id)->ttl_hours == 1);

  queue.OnHourTick(market.ctx, 1);
  assert(market.ctx.listings.Find(id) == nullptr);
  assert(market.ctx.listings.TombstoneFor(id)->status == ListingStatus::kExpired);
}

void TestPurchaseDebitsAndRetires() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       id = market.AddFoundListing(kPlayer, 64000.0).id;

  const auto result = queue.Purchase(market.ctx, id, kPlayer);
  assert(result.price_paid == 64000.0);
  assert(result.listing.status == ListingStatus::kSold);
  assert(market.ledger->Balance(kPlayer) == 1'000'000.0 - 64000.0);
  assert(market.ctx.listings.Find(id) == nullptr);

  bool raced = false;
  try {
    queue.Purchase(market.ctx, id, kPlayer);
  } catch (const usedgear::util::RaceRejection&) {
    raced = true;
  }
  assert(raced);
  assert(market.ledger->Balance(kPlayer) == 1'000'000.0 - 64000.0);
}

void TestPurchaseWithoutFundsKeepsListing() {
  TestMarket       market(42, 1000.0);
  AcquisitionQueue queue;
  const auto       id = market.AddFoundListing(kPlayer, 64000.0).id;

  bool threw = false;
  try {
    queue.Purchase(market.ctx, id, kPlayer);
  } catch (const usedgear::util::FundsError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.listings.Find(id) != nullptr);
  assert(market.ctx.listings.Find(id)->status == ListingStatus::kFound);
  assert(market.ledger->Balance(kPlayer) == 1000.0);
}

void TestWalkAwayIsIrrecoverable() {
  TestMarket       market;
  AcquisitionQueue queue;

  std::string gone;
  for (int i = 0; i < 50 && gone.empty(); ++i) {
    const auto id     = market.AddFoundListing(kPlayer, 100000.0, 0.9).id;
    const auto result = queue.SubmitOffer(market.ctx, id, kPlayer, 20000.0);
    assert(result.outcome.kind == OutcomeKind::kWalkedAway || result.outcome.kind == OutcomeKind::kRejected);
    if (result.outcome.kind == OutcomeKind::kWalkedAway) {
      assert(result.listing_status == ListingStatus::kWithdrawn);
      gone = id;
    }
  }
  assert(!gone.empty());
  assert(market.ctx.listings.TombstoneFor(gone)->status == ListingStatus::kWithdrawn);
  market.notifications->Drain();

  bool raced = false;
  try {
    queue.SubmitOffer(market.ctx, gone, kPlayer, 99000.0);
  } catch (const usedgear::util::RaceRejection&) {
    raced = true;
  }
  assert(raced);
  assert(HasWarning(market));
}

void TestOfferValidation() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       id = market.AddFoundListing(kPlayer, 80000.0).id;

  bool threw = false;
  try {
    queue.SubmitOffer(market.ctx, id, kPlayer, -5.0);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.SubmitOffer(market.ctx, id, "player-2", 70000.0);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.AcceptCounter(market.ctx, id, kPlayer);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.SubmitOffer(market.ctx, "LISTING_99999999", kPlayer, 70000.0);
  } catch (const usedgear::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.listings.Find(id)->status == ListingStatus::kFound);
}

void TestAcceptCounterBuysAtCounter() {
  TestMarket       market;
  AcquisitionQueue queue;

  for (int i = 0; i < 50; ++i) {
    const auto id     = market.AddFoundListing(kPlayer, 100000.0, 0.5).id;
    const auto result = queue.SubmitOffer(market.ctx, id, kPlayer, 85000.0);
    if (result.outcome.kind != OutcomeKind::kCountered) continue;

    const double counter = result.outcome.price;
    assert(counter > 85000.0 && counter <= 100000.0);
    assert(market.ctx.listings.Find(id)->status == ListingStatus::kNegotiating);

    const double before   = market.ledger->Balance(kPlayer);
    const auto   accepted = queue.AcceptCounter(market.ctx, id, kPlayer);
    assert(accepted.listing_status == ListingStatus::kSold);
    assert(accepted.price_paid == counter);
    assert(market.ledger->Balance(kPlayer) == before - counter);
    return;
  }
  assert(false && "no counter offer in 50 tries");
}

// A Regional search for an excavator that came back empty.
usedgear::model::SearchRequest& AddFailedSearch(TestMarket& market, const std::string& requester_id = kPlayer) {
  usedgear::model::SearchRequest search;
  search.id           = market.ctx.ids.NextSearchId();
  search.requester_id = requester_id;
  search.category     = Excavator();
  search.quality_tier = usedgear::model::QualityTier::kGood;
  search.agent_tier   = usedgear::model::AgentTier::kRegional;
  search.fee_paid     = 1500.0;
  search.status       = SearchStatus::kFailed;
  search.ttl_hours    = 72;
  return market.ctx.searches[search.id] = search;
}

void TestRenewFailedSearch() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       failed_id = AddFailedSearch(market).id;

  bool threw = false;
  try {
    queue.RenewSearch(market.ctx, failed_id, "player-2");
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto renewed = queue.RenewSearch(market.ctx, failed_id, kPlayer);
  assert(renewed.id != failed_id);
  assert(renewed.status == SearchStatus::kActive);
  assert(renewed.category.id == "excavator");
  assert(renewed.quality_tier == usedgear::model::QualityTier::kGood);
  assert(renewed.agent_tier == usedgear::model::AgentTier::kRegional);
  assert(renewed.fee_paid == 1500.0);
  assert(market.ledger->Balance(kPlayer) == 1'000'000.0 - 1500.0);
  assert(market.ctx.searches.size() == 1);
  assert(market.ctx.searches.count(failed_id) == 0);

  threw = false;
  try {
    queue.RenewSearch(market.ctx, failed_id, kPlayer);
  } catch (const usedgear::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.RenewSearch(market.ctx, renewed.id, kPlayer);
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(market.ctx.searches.size() == 1);
}

void TestRenewWithoutFundsKeepsFailedSearch() {
  TestMarket       market(42, 10.0);
  AcquisitionQueue queue;
  const auto       failed_id = AddFailedSearch(market).id;
  const auto       ids       = market.ctx.ids.Counter();
  market.notifications->Drain();

  bool threw = false;
  try {
    queue.RenewSearch(market.ctx, failed_id, kPlayer);
  } catch (const usedgear::util::FundsError&) {
    threw = true;
  }
  assert(threw);
  assert(HasWarning(market));
  assert(market.ledger->Balance(kPlayer) == 10.0);
  assert(market.ctx.ids.Counter() == ids);
  assert(market.ctx.searches.size() == 1);
  assert(market.ctx.searches.at(failed_id).status == SearchStatus::kFailed);
}

void TestRenewRespectsSearchLimit() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       failed_id = AddFailedSearch(market).id;

  for (int i = 0; i < 5; ++i) {
    queue.RequestSearch(market.ctx, kPlayer, Excavator(), 3, 1);
  }
  const double balance = market.ledger->Balance(kPlayer);

  bool threw = false;
  try {
    queue.RenewSearch(market.ctx, failed_id, kPlayer);
  } catch (const usedgear::util::LimitExceeded&) {
    threw = true;
  }
  assert(threw);
  assert(market.ledger->Balance(kPlayer) == balance);
  assert(market.ctx.searches.at(failed_id).status == SearchStatus::kFailed);
}

void TestFailedSearchLapsesAfterRenewalWindow() {
  TestMarket       market;
  AcquisitionQueue queue;
  const auto       failed_id = AddFailedSearch(market).id;

  queue.OnHourTick(market.ctx, 71);
  assert(market.ctx.searches.at(failed_id).ttl_hours == 1);

  queue.OnHourTick(market.ctx, 1);
  assert(market.ctx.searches.empty());
}

void TestCancelSearchForfeitsRetainer() {
  TestMarket       market;
  AcquisitionQueue queue;

  const auto search = queue.RequestSearch(market.ctx, kPlayer, Excavator(), 3, 1);
  const double after_fee = market.ledger->Balance(kPlayer);

  bool threw = false;
  try {
    queue.CancelSearch(market.ctx, search.id, "player-2");
  } catch (const usedgear::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto cancelled = queue.CancelSearch(market.ctx, search.id, kPlayer);
  assert(cancelled.status == SearchStatus::kCancelled);
  assert(market.ctx.searches.empty());
  assert(market.ledger->Balance(kPlayer) == after_fee);

  threw = false;
  try {
    queue.CancelSearch(market.ctx, search.id, kPlayer);
  } catch (const usedgear::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestActiveSearchLimit();
  TestInsufficientFundsChangesNothing();
  TestInvalidCategoryRejected();
  TestSearchResolvesIntoFoundListings();
  TestFoundListingWindowStartsWhenViewed();
  TestPurchaseDebitsAndRetires();
  TestPurchaseWithoutFundsKeepsListing();
  TestWalkAwayIsIrrecoverable();
  TestOfferValidation();
  TestAcceptCounterBuysAtCounter();
  TestRenewFailedSearch();
  TestRenewWithoutFundsKeepsFailedSearch();
  TestRenewRespectsSearchLimit();
  TestFailedSearchLapsesAfterRenewalWindow();
  TestCancelSearchForfeitsRetainer();

  std::cout << "usedgear_unit_acquisition_queue: pass\n";
  return 0;
}
