#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/market_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/persistence/record_codec.hpp"
#include "internal/persistence/snapshot_store.hpp"
#include "tests/unit/market_fixture.hpp"

namespace {

using usedgear::core::MarketEngine;
using usedgear::db::Repository;
using usedgear::db::model::FlatRecord;
using usedgear::market::MarketContext;
using usedgear::persistence::LoadReport;
using usedgear::persistence::SnapshotStore;
using usedgear::testing::TestMarket;

constexpr const char* kPlayer = "player-1";

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct Backend {
  std::string                 name;
  std::shared_ptr<Repository> repository;
};

Backend MakeMemoryBackend() {
  return Backend{"memory", std::make_shared<usedgear::db::memory::MemoryRepository>()};
}

Backend MakeSqliteBackend(const std::string& path) {
  auto db = std::make_shared<usedgear::db::sqlite::SqliteDB>(path, true);
  // replaying the schema on an existing store is a no-op
  db->ApplySchema(usedgear::db::sql::MarketRecordSchema());
  db->ApplySchema(usedgear::db::sql::MarketRecordSchema());
  assert(db->SchemaVersion() == usedgear::db::sql::kMarketSchemaVersion);
  return Backend{"sqlite", std::make_shared<usedgear::db::sqlite::SqliteRepository>(db)};
}

// Drives a market through every record kind: live and resolved listings,
// an active search, a sale, and a pending inspection with its hold.
void BuildScenario(TestMarket& market) {
  MarketEngine engine;
  auto&        ctx = market.ctx;

  const auto inspected = market.AddFoundListing(kPlayer, 100000.0).id;
  const auto bought    = market.AddFoundListing(kPlayer, 60000.0).id;
  const auto haggled   = market.AddFoundListing(kPlayer, 100000.0, 0.5).id;

  engine.RequestSearch(ctx, kPlayer, usedgear::testing::Excavator(), 3, 2);
  engine.ListForSale(ctx, kPlayer, usedgear::testing::Tractor(), 1);
  engine.ViewListing(ctx, inspected, kPlayer);

  engine.OnHourTick(ctx, 3);

  engine.RequestInspection(ctx, inspected, kPlayer, 2);
  engine.PurchaseListing(ctx, bought, kPlayer);
  engine.SubmitOffer(ctx, haggled, kPlayer, 85000.0);
}

void AssertSameListings(const MarketContext& a, const MarketContext& b) {
  const auto& la = a.listings.Live();
  const auto& lb = b.listings.Live();
  assert(la.size() == lb.size());
  for (const auto& [id, x] : la) {
    const auto it = lb.find(id);
    assert(it != lb.end());
    const auto& y = it->second;
    assert(x.owner_id == y.owner_id);
    assert(x.source_id == y.source_id);
    assert(x.origin == y.origin);
    assert(x.status == y.status);
    assert(x.created_at_hour == y.created_at_hour);
    assert(x.ttl_hours == y.ttl_hours);
    assert(x.on_hold == y.on_hold);
    assert(x.viewed == y.viewed);
    assert(x.asking_price == y.asking_price);
    assert(x.price == y.price);
    assert(x.Revealed() == y.Revealed());
    assert(x.PrivilegedHidden().dna == y.PrivilegedHidden().dna);
    assert(x.PrivilegedHidden().overall_rating == y.PrivilegedHidden().overall_rating);
    assert(x.negotiation.has_value() == y.negotiation.has_value());
  }

  const auto& ta = a.listings.Tombstones();
  const auto& tb = b.listings.Tombstones();
  assert(ta.size() == tb.size());
  for (const auto& [id, tombstone] : ta) {
    const auto other = b.listings.TombstoneFor(id);
    assert(other.has_value());
    assert(other->status == tombstone.status);
    assert(other->period == tombstone.period);
  }
}

void AssertSameQueues(const MarketContext& a, const MarketContext& b) {
  assert(a.searches.size() == b.searches.size());
  for (const auto& [id, search] : a.searches) {
    const auto it = b.searches.find(id);
    assert(it != b.searches.end());
    assert(it->second.status == search.status);
    assert(it->second.completes_at_hour == search.completes_at_hour);
    assert(it->second.fee_paid == search.fee_paid);
    assert(it->second.result_ids == search.result_ids);
  }

  assert(a.sales.size() == b.sales.size());
  for (const auto& [id, sale] : a.sales) {
    const auto it = b.sales.find(id);
    assert(it != b.sales.end());
    assert(it->second.listing_id == sale.listing_id);
    assert(it->second.status == sale.status);
    assert(it->second.asking_price == sale.asking_price);
    assert(it->second.expected_min == sale.expected_min);
    assert(it->second.expected_max == sale.expected_max);
    assert(it->second.pending_offer.has_value() == sale.pending_offer.has_value());
  }

  assert(a.inspections.size() == b.inspections.size());
  for (const auto& [id, inspection] : a.inspections) {
    const auto it = b.inspections.find(id);
    assert(it != b.inspections.end());
    assert(it->second.id == inspection.id);
    assert(it->second.tier == inspection.tier);
    assert(it->second.state == inspection.state);
    assert(it->second.completes_at_hour == inspection.completes_at_hour);
  }

  const auto ha = a.holds.All();
  const auto hb = b.holds.All();
  assert(ha.size() == hb.size());
  for (std::size_t i = 0; i < ha.size(); ++i) {
    assert(ha[i].hold_id == hb[i].hold_id);
    assert(ha[i].listing_id == hb[i].listing_id);
    assert(ha[i].releases_at_hour == hb[i].releases_at_hour);
  }
}

void AssertSameEngineState(MarketContext& a, MarketContext& b) {
  assert(a.clock.Now() == b.clock.Now());
  assert(a.clock.Period() == b.clock.Period());
  assert(a.ids.Counter() == b.ids.Counter());
  assert(a.rng.Seed() == b.rng.Seed());
  AssertSameListings(a, b);
  AssertSameQueues(a, b);
}

void VerifyRoundTrip(Backend& backend, TestMarket& source) {
  SnapshotStore store(backend.repository);

  TestMarket empty(7);
  assert(!store.Load(empty.ctx));

  const auto written = store.Save(source.ctx);
  assert(written > 0);

  TestMarket restored(7);
  LoadReport report;
  assert(store.Load(restored.ctx, &report));
  assert(report.loaded == written);
  assert(report.skipped == 0);

  AssertSameEngineState(source.ctx, restored.ctx);
  assert(!restored.ctx.inspections.empty());
  assert(restored.ctx.holds.Size() == 1);

  // A second save of the restored market matches the first one record for record.
  assert(store.Save(restored.ctx) == written);

  std::cout << "  " << backend.name << ": " << written << " records\n";
}

void VerifyRandomStreamContinues(Backend& backend, TestMarket& source) {
  SnapshotStore store(backend.repository);
  store.Save(source.ctx);

  TestMarket restored(99);
  assert(store.Load(restored.ctx));

  // Copy the source stream so the check does not disturb it.
  auto expected = source.ctx.rng;
  for (int i = 0; i < 16; ++i) {
    assert(restored.ctx.rng.Unit() == expected.Unit());
  }
}

void VerifyCorruptRecordIsSkipped(Backend& backend, TestMarket& source) {
  SnapshotStore store(backend.repository);
  store.Save(source.ctx);

  {
    FlatRecord bad;
    bad.kind                      = usedgear::persistence::kListingKind;
    bad.id                        = "LISTING_99999999";
    bad.attributes["owner_id"]    = kPlayer;
    bad.attributes["ttl_hours"]   = "-4";
    bad.attributes["asking_price"] = "not-a-number";

    auto tx = backend.repository->Begin(usedgear::db::TxMode::kWrite);
    assert(backend.repository->PutRecord(*tx, bad));
    tx->Commit();
  }

  TestMarket restored(7);
  LoadReport report;
  assert(store.Load(restored.ctx, &report));
  assert(report.skipped == 1);
  assert(restored.ctx.listings.Find("LISTING_99999999") == nullptr);
  AssertSameListings(source.ctx, restored.ctx);
}

void VerifyCorruptSaleWithdrawsItsListing(Backend& backend, TestMarket& source) {
  SnapshotStore store(backend.repository);
  store.Save(source.ctx);

  assert(source.ctx.sales.size() == 1);
  const auto sale_id    = source.ctx.sales.begin()->first;
  const auto listing_id = source.ctx.sales.begin()->second.listing_id;
  {
    auto tx     = backend.repository->Begin(usedgear::db::TxMode::kWrite);
    auto record = backend.repository->GetRecord(*tx, usedgear::persistence::kSaleKind, sale_id);
    assert(record.has_value());
    record->attributes["fee_paid"] = "garbage";
    assert(backend.repository->PutRecord(*tx, *record));
    tx->Commit();
  }

  TestMarket restored(7);
  LoadReport report;
  assert(store.Load(restored.ctx, &report));
  assert(report.skipped == 2);
  assert(restored.ctx.sales.empty());
  assert(restored.ctx.listings.Find(listing_id) == nullptr);
  assert(restored.ctx.listings.TombstoneFor(listing_id)->status == usedgear::model::ListingStatus::kWithdrawn);
  assert(restored.notifications->Pending() == 1);

  MarketEngine engine;
  engine.OnHourTick(restored.ctx, restored.ctx.clock.Now() + 500);
  for (const auto& view : engine.GetActiveListings(restored.ctx, kPlayer)) {
    assert(view.id != listing_id);
  }
}

void VerifyReadTransactionRejectsWrites(Backend& backend) {
  FlatRecord record;
  record.kind = usedgear::persistence::kMetaKind;
  record.id   = usedgear::persistence::kMetaId;

  auto       tx    = backend.repository->Begin(usedgear::db::TxMode::kRead);
  const auto put   = backend.repository->PutRecord(*tx, record);
  const auto clear = backend.repository->ClearAll(*tx);
  assert(!put && put.code == usedgear::db::ErrorCode::ConstraintViolation);
  assert(!clear && clear.code == usedgear::db::ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyBackendsAgree(Backend& memory, Backend& sqlite) {
  TestMarket from_memory(7);
  TestMarket from_sqlite(7);
  assert(SnapshotStore(memory.repository).Load(from_memory.ctx));
  assert(SnapshotStore(sqlite.repository).Load(from_sqlite.ctx));
  AssertSameEngineState(from_memory.ctx, from_sqlite.ctx);
}

} // namespace

int main() {
  const auto sqlite_path =
      (std::filesystem::temp_directory_path() / ("usedgear_snapshot_parity_" + std::to_string(NowMs()) + ".db")).string();

  {
    TestMarket source;
    BuildScenario(source);

    auto memory = MakeMemoryBackend();
    auto sqlite = MakeSqliteBackend(sqlite_path);

    for (auto* backend : {&memory, &sqlite}) {
      VerifyRoundTrip(*backend, source);
      VerifyRandomStreamContinues(*backend, source);
      VerifyReadTransactionRejectsWrites(*backend);
    }
    VerifyBackendsAgree(memory, sqlite);

    for (auto* backend : {&memory, &sqlite}) {
      VerifyCorruptRecordIsSkipped(*backend, source);
      VerifyCorruptSaleWithdrawsItsListing(*backend, source);
    }
  }

  std::error_code ec;
  std::filesystem::remove(sqlite_path, ec);
  std::filesystem::remove(sqlite_path + "-wal", ec);
  std::filesystem::remove(sqlite_path + "-shm", ec);

  std::cout << "usedgear_integration_snapshot_parity: pass\n";
  return 0;
}
