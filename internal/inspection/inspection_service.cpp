#include "inspection_service.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::inspection {

using host::Severity;
using market::MarketContext;
using market::NotifyAndThrow;
using model::InspectionState;
using model::ListingStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Money(double amount) {
  return fmt::format("${:.0f}", amount);
}

std::string Percent(double fraction) {
  return fmt::format("{:.0f}%", fraction * 100.0);
}

// One-line report of what this inspection uncovered.
std::string Report(const model::ListingRecord& listing, const market::InspectionTierSpec& tier) {
  const auto& hidden = listing.PrivilegedHidden();

  std::string report = fmt::format("{} inspection of {} complete: overall rating {:.0f}/100", tier.name,
                                   listing.category_name, hidden.overall_rating);
  for (auto field : tier.reveals) {
    switch (field) {
      case model::ConditionField::kEngineReliability:
        report += ", engine " + Percent(hidden.engine_reliability);
        break;
      case model::ConditionField::kHydraulicReliability:
        report += ", hydraulics " + Percent(hidden.hydraulic_reliability);
        break;
      case model::ConditionField::kElectricalReliability:
        report += ", electrics " + Percent(hidden.electrical_reliability);
        break;
      case model::ConditionField::kReliabilityCeiling:
        report += ", long-term ceiling " + Percent(hidden.reliability_ceiling);
        break;
      case model::ConditionField::kQualityHint:
        report += ", inspector says: " + std::string(model::QualityHint(hidden.dna));
        break;
      case model::ConditionField::kOverallRating:
        break;
    }
  }
  return report;
}

} // namespace

model::InspectionRecord InspectionService::Request(MarketContext& ctx, const std::string& listing_id,
                                                   const std::string& requester_id, std::int64_t tier_index) {
  const auto tier = model::InspectionTierFromIndex(tier_index);
  if (!tier) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, fmt::format("Inspection tier {} does not exist", tier_index));
  }

  auto& listing = market::RequireLiveListing(ctx, listing_id, requester_id);
  if (listing.origin != model::ListingOrigin::kSearch || listing.owner_id != requester_id) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Listing " + listing_id + " cannot be inspected by you");
  }
  if (listing.status != ListingStatus::kFound && listing.status != ListingStatus::kNegotiating) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Listing " + listing_id + " is not open for inspection");
  }

  const auto now = ctx.clock.Now();
  if (auto existing = ctx.inspections.find(listing_id); existing != ctx.inspections.end()) {
    if (existing->second.state == InspectionState::kPending) {
      NotifyAndThrow<util::ValidationError>(ctx, requester_id, "An inspection of " + listing_id + " is already in progress");
    }
    if (existing->second.state == InspectionState::kComplete) {
      NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Listing " + listing_id + " has already been inspected");
    }
  }
  if (ctx.holds.HasActive(listing_id, now)) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "An inspection of " + listing_id + " is already in progress");
  }

  const auto&  spec = ctx.tables.Inspection(*tier);
  const double fee  = market::InspectionFee(spec, listing.asking_price);
  if (!ctx.host.ledger->Debit(requester_id, fee)) {
    NotifyAndThrow<util::FundsError>(ctx, requester_id, "Not enough money for the " + Money(fee) + " inspection fee");
  }

  model::InspectionRecord record;
  record.id                = ctx.ids.NextInspectionId();
  record.listing_id        = listing_id;
  record.requester_id      = requester_id;
  record.tier              = *tier;
  record.fee_paid          = fee;
  record.requested_at_hour = now;
  record.completes_at_hour = now + spec.duration_hours;
  record.state             = InspectionState::kPending;

  ctx.holds.Insert(Hold{record.id, listing_id, now, record.completes_at_hour});
  listing.on_hold             = true;
  ctx.inspections[listing_id] = record;

  USEDGEAR_LOG_INFO("Inspection scheduled", {StringField("inspection_id", record.id), StringField("listing_id", listing_id),
                                             StringField("tier", model::ToString(*tier)), DoubleField("fee", fee),
                                             IntField("completes_at_hour", static_cast<std::int64_t>(record.completes_at_hour))});
  ctx.Notify(requester_id,
             fmt::format("{} inspection of {} booked; report in {} hours", spec.name, listing.category_name, spec.duration_hours),
             Severity::kInfo);
  return record;
}

model::InspectionRecord InspectionService::Cancel(MarketContext& ctx, const std::string& listing_id,
                                                  const std::string& requester_id) {
  auto it = ctx.inspections.find(listing_id);
  if (it == ctx.inspections.end()) {
    if (ctx.listings.TombstoneFor(listing_id)) {
      market::RequireLiveListing(ctx, listing_id, requester_id);
    }
    NotifyAndThrow<util::NotFound>(ctx, requester_id, "No inspection found for " + listing_id);
  }

  auto& record = it->second;
  if (record.requester_id != requester_id) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Inspection of " + listing_id + " belongs to another requester");
  }
  if (record.state != InspectionState::kPending) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Inspection of " + listing_id + " is no longer in progress");
  }

  record.state = InspectionState::kCancelled;
  ctx.holds.Remove(record.id);
  if (auto* listing = ctx.listings.Find(listing_id)) {
    listing->on_hold = false;
  }

  USEDGEAR_LOG_INFO("Inspection cancelled", {StringField("inspection_id", record.id), StringField("listing_id", listing_id)});
  ctx.Notify(requester_id, "Inspection cancelled; the " + Money(record.fee_paid) + " fee is not refunded", Severity::kInfo);
  return record;
}

const model::InspectionRecord& InspectionService::Get(const MarketContext& ctx, const std::string& listing_id) const {
  auto it = ctx.inspections.find(listing_id);
  if (it == ctx.inspections.end()) {
    throw util::NotFound("No inspection found for " + listing_id);
  }
  return it->second;
}

std::uint32_t InspectionService::HoursRemaining(const MarketContext& ctx, const model::InspectionRecord& record) {
  if (record.state != InspectionState::kPending) return 0;
  return util::HoursUntil(ctx.clock.Now(), record.completes_at_hour);
}

void InspectionService::Complete(MarketContext& ctx, model::InspectionRecord& record) {
  auto* listing = ctx.listings.Find(record.listing_id);
  if (listing == nullptr) {
    record.state = InspectionState::kCancelled;
    ctx.holds.Remove(record.id);
    return;
  }

  const auto& spec = ctx.tables.Inspection(record.tier);
  for (auto field : spec.reveals) {
    listing->Reveal(field);
  }
  listing->on_hold = false;
  ctx.holds.Remove(record.id);
  record.state = InspectionState::kComplete;

  USEDGEAR_LOG_INFO("Inspection complete", {StringField("inspection_id", record.id), StringField("listing_id", listing->id),
                                            DoubleField("overall_rating", listing->PrivilegedHidden().overall_rating)});
  ctx.Notify(record.requester_id, Report(*listing, spec), Severity::kOk);
}

void InspectionService::OnHourTick(MarketContext& ctx) {
  const auto now = ctx.clock.Now();
  for (auto& [listing_id, record] : ctx.inspections) {
    if (record.state == InspectionState::kPending && now >= record.completes_at_hour) {
      Complete(ctx, record);
    }
  }
}

} // namespace usedgear::inspection
