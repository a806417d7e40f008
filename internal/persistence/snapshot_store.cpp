#include "snapshot_store.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/persistence/record_codec.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::persistence {

using db::model::FlatRecord;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Corruption:
      throw util::CorruptRecordError(message);
    default:
      throw std::runtime_error(message);
  }
}

struct StoredSnapshot {
  FlatRecord              meta;
  std::vector<FlatRecord> listings;
  std::vector<FlatRecord> tombstones;
  std::vector<FlatRecord> searches;
  std::vector<FlatRecord> sales;
  std::vector<FlatRecord> inspections;
};

void SkipCorrupt(const FlatRecord& record, const std::exception& e, LoadReport& report) {
  ++report.skipped;
  USEDGEAR_LOG_WARN("Skipping corrupt record", {StringField("kind", record.kind), StringField("id", record.id),
                                                StringField("error", e.what())});
}

void SkipOrphan(const FlatRecord& record, const std::string& listing_id, LoadReport& report) {
  ++report.skipped;
  USEDGEAR_LOG_WARN("Skipping record for unknown listing",
                    {StringField("kind", record.kind), StringField("id", record.id), StringField("listing_id", listing_id)});
}

} // namespace

SnapshotStore::SnapshotStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("snapshot store requires a repository");
  }
}

std::size_t SnapshotStore::Save(const market::MarketContext& ctx) {
  std::vector<FlatRecord> records;

  EngineMeta meta;
  meta.hour       = ctx.clock.Now();
  meta.period     = ctx.clock.Period();
  meta.id_counter = ctx.ids.Counter();
  meta.seed       = ctx.rng.Seed();
  meta.rng_state  = ctx.rng.State();
  records.push_back(EncodeMeta(meta));

  for (const auto& [id, listing] : ctx.listings.Live()) records.push_back(EncodeListing(listing));
  for (const auto& [id, tombstone] : ctx.listings.Tombstones()) records.push_back(EncodeTombstone(id, tombstone));
  for (const auto& [id, search] : ctx.searches) records.push_back(EncodeSearch(search));
  for (const auto& [id, sale] : ctx.sales) records.push_back(EncodeSale(sale));
  for (const auto& [id, inspection] : ctx.inspections) records.push_back(EncodeInspection(inspection));

  auto tx = repository_->Begin(db::TxMode::kWrite);
  ThrowIfDbError(repository_->ClearAll(*tx), "clear snapshot");
  for (const auto& record : records) {
    ThrowIfDbError(repository_->PutRecord(*tx, record), "put " + record.kind + " " + record.id);
  }
  tx->Commit();

  USEDGEAR_LOG_INFO("Snapshot saved", {IntField("records", static_cast<std::int64_t>(records.size())),
                                       IntField("hour", static_cast<std::int64_t>(meta.hour))});
  return records.size();
}

bool SnapshotStore::Load(market::MarketContext& ctx, LoadReport* report_out) {
  StoredSnapshot stored;
  {
    auto tx   = repository_->Begin(db::TxMode::kRead);
    auto meta = repository_->GetRecord(*tx, kMetaKind, kMetaId);
    if (!meta) {
      tx->Rollback();
      return false;
    }
    stored.meta        = std::move(*meta);
    stored.listings    = repository_->ListRecords(*tx, kListingKind);
    stored.tombstones  = repository_->ListRecords(*tx, kTombstoneKind);
    stored.searches    = repository_->ListRecords(*tx, kSearchKind);
    stored.sales       = repository_->ListRecords(*tx, kSaleKind);
    stored.inspections = repository_->ListRecords(*tx, kInspectionKind);
    tx->Commit();
  }

  // Meta is decoded before anything is touched: without it the snapshot
  // cannot be placed in time.
  const EngineMeta meta = DecodeMeta(stored.meta);

  LoadReport report;
  ctx.Reset();
  ctx.clock.Restore(meta.hour, meta.period);
  ctx.ids.Restore(meta.id_counter);
  if (meta.rng_state.empty()) {
    ctx.rng.Reseed(meta.seed);
  } else {
    ctx.rng.RestoreState(meta.seed, meta.rng_state);
  }
  ++report.loaded;

  for (const auto& record : stored.listings) {
    try {
      ctx.listings.Insert(DecodeListing(record));
      ++report.loaded;
    } catch (const util::CorruptRecordError& e) {
      SkipCorrupt(record, e, report);
    } catch (const std::invalid_argument& e) {
      SkipCorrupt(record, e, report);
    }
  }

  for (const auto& record : stored.tombstones) {
    try {
      auto [id, tombstone] = DecodeTombstone(record);
      ctx.listings.RestoreTombstone(id, tombstone);
      ++report.loaded;
    } catch (const util::CorruptRecordError& e) {
      SkipCorrupt(record, e, report);
    }
  }

  for (const auto& record : stored.searches) {
    try {
      auto search = DecodeSearch(record);
      const auto id = search.id;
      ctx.searches.emplace(id, std::move(search));
      ++report.loaded;
    } catch (const util::CorruptRecordError& e) {
      SkipCorrupt(record, e, report);
    }
  }

  for (const auto& record : stored.sales) {
    try {
      auto sale = DecodeSale(record);
      if (ctx.listings.Find(sale.listing_id) == nullptr) {
        SkipOrphan(record, sale.listing_id, report);
        continue;
      }
      const auto id = sale.id;
      ctx.sales.emplace(id, std::move(sale));
      ++report.loaded;
    } catch (const util::CorruptRecordError& e) {
      SkipCorrupt(record, e, report);
    }
  }

  // A sale listing whose sale record was dropped has no agent working it;
  // withdraw it so the owner gets the item back.
  std::vector<std::string> unowned;
  for (const auto& [id, listing] : ctx.listings.Live()) {
    if (listing.origin == model::ListingOrigin::kSale && ctx.sales.count(listing.source_id) == 0) {
      unowned.push_back(id);
    }
  }
  for (const auto& id : unowned) {
    const auto* listing = ctx.listings.Find(id);
    const auto  owner   = listing->owner_id;
    const auto  name    = listing->category_name;
    USEDGEAR_LOG_WARN("Withdrawing sale listing without a sale",
                      {StringField("listing_id", id), StringField("sale_id", listing->source_id)});
    market::RetireListing(ctx, id, model::ListingStatus::kWithdrawn);
    --report.loaded;
    ++report.skipped;
    ctx.Notify(owner, "The sale of " + name + " could not be restored; it is back in your inventory",
               host::Severity::kWarning);
  }

  for (const auto& record : stored.inspections) {
    try {
      auto inspection = DecodeInspection(record);
      auto* listing   = ctx.listings.Find(inspection.listing_id);
      if (listing == nullptr) {
        SkipOrphan(record, inspection.listing_id, report);
        continue;
      }
      if (inspection.state == model::InspectionState::kPending) {
        ctx.holds.Insert(inspection::Hold{inspection.id, inspection.listing_id, inspection.requested_at_hour,
                                          inspection.completes_at_hour});
        listing->on_hold = true;
      }
      const auto listing_id = inspection.listing_id;
      ctx.inspections.emplace(listing_id, std::move(inspection));
      ++report.loaded;
    } catch (const util::CorruptRecordError& e) {
      SkipCorrupt(record, e, report);
    }
  }

  // A hold without a pending inspection behind it would freeze the
  // listing forever.
  for (auto& [id, listing] : ctx.listings.Live()) {
    if (listing.on_hold && !ctx.holds.HasActive(id, ctx.clock.Now())) {
      listing.on_hold = false;
    }
  }

  USEDGEAR_LOG_INFO("Snapshot loaded", {IntField("loaded", static_cast<std::int64_t>(report.loaded)),
                                        IntField("skipped", static_cast<std::int64_t>(report.skipped)),
                                        IntField("hour", static_cast<std::int64_t>(meta.hour))});
  if (report_out != nullptr) *report_out = report;
  return true;
}

} // namespace usedgear::persistence
