#include "acquisition_queue.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/condition/condition_generator.hpp"
#include "internal/negotiation/personality.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::acquisition {

using host::Severity;
using market::MarketContext;
using market::NotifyAndThrow;
using model::ListingStatus;
using model::NegotiationState;
using model::OutcomeKind;
using model::SearchStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr double kMinSearchSuccess = 0.05;
constexpr double kMaxSearchSuccess = 0.95;

std::string Money(double amount) {
  return fmt::format("${:.0f}", amount);
}

std::size_t CountActiveSearches(const MarketContext& ctx, const std::string& requester_id) {
  return static_cast<std::size_t>(std::count_if(ctx.searches.begin(), ctx.searches.end(), [&](const auto& entry) {
    const auto& search = entry.second;
    return search.requester_id == requester_id &&
           (search.status == SearchStatus::kActive || search.status == SearchStatus::kSucceeded);
  }));
}

} // namespace

model::SearchRequest AcquisitionQueue::RequestSearch(MarketContext& ctx, const std::string& requester_id,
                                                     const model::Category& category, std::int64_t quality_index,
                                                     std::int64_t agent_index) {
  if (requester_id.empty()) {
    throw util::ValidationError("requester id is required");
  }
  if (category.id.empty()) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Search needs a category");
  }
  return OpenSearch(ctx, requester_id, category, condition::ConditionGenerator::ResolveQuality(quality_index),
                    condition::ConditionGenerator::ResolveAgent(agent_index));
}

model::SearchRequest AcquisitionQueue::RenewSearch(MarketContext& ctx, const std::string& search_id,
                                                   const std::string& requester_id) {
  if (requester_id.empty()) {
    throw util::ValidationError("requester id is required");
  }
  auto it = ctx.searches.find(search_id);
  if (it == ctx.searches.end()) {
    NotifyAndThrow<util::NotFound>(ctx, requester_id, "Search " + search_id + " not found");
  }
  if (it->second.requester_id != requester_id) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Search " + search_id + " belongs to another requester");
  }
  if (it->second.status == SearchStatus::kActive) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Search " + search_id + " is still running");
  }

  const auto previous = it->second;
  auto renewed = OpenSearch(ctx, requester_id, previous.category, previous.quality_tier, previous.agent_tier);
  if (previous.status == SearchStatus::kFailed) {
    ctx.searches.erase(search_id);
  }

  USEDGEAR_LOG_INFO("Search renewed", {StringField("search_id", search_id), StringField("renewed_as", renewed.id)});
  return renewed;
}

model::SearchRequest AcquisitionQueue::OpenSearch(MarketContext& ctx, const std::string& requester_id,
                                                  const model::Category& category, model::QualityTier quality,
                                                  model::AgentTier agent) {
  if (!(category.base_price > 0.0) || !std::isfinite(category.base_price)) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Category " + category.id + " has no valid base price");
  }
  if (CountActiveSearches(ctx, requester_id) >= ctx.tables.max_active_searches) {
    NotifyAndThrow<util::LimitExceeded>(
        ctx, requester_id, fmt::format("You already have {} active searches", ctx.tables.max_active_searches));
  }

  const auto& spec = ctx.tables.Search(agent);

  const double credit_modifier =
      ctx.host.credit ? market::CreditFeeModifier(ctx.host.credit->Score(requester_id)) : 0.0;
  const double fee = market::SearchRetainer(spec, category.base_price, credit_modifier);

  const auto months = static_cast<std::uint32_t>(ctx.rng.UniformInt(spec.min_months, spec.max_months));

  if (!ctx.host.ledger->Debit(requester_id, fee)) {
    NotifyAndThrow<util::FundsError>(ctx, requester_id, "Not enough money for the " + Money(fee) + " search retainer");
  }

  model::SearchRequest search;
  search.id                = ctx.ids.NextSearchId();
  search.requester_id      = requester_id;
  search.category          = category;
  search.quality_tier      = quality;
  search.agent_tier        = agent;
  search.fee_paid          = fee;
  search.created_at_hour   = ctx.clock.Now();
  search.ttl_hours         = months * ctx.tables.months_to_hours;
  search.completes_at_hour = search.created_at_hour + search.ttl_hours;
  search.find_count        = spec.find_count;

  ctx.searches[search.id] = search;

  USEDGEAR_LOG_INFO("Search requested", {StringField("search_id", search.id), StringField("requester_id", requester_id),
                                         StringField("category", category.id), StringField("quality", model::ToString(quality)),
                                         StringField("agent", model::ToString(agent)), DoubleField("fee", fee)});
  ctx.Notify(requester_id,
             fmt::format("{} agent is looking for {} ({} hours)", spec.name, category.name.empty() ? category.id : category.name,
                         search.ttl_hours),
             Severity::kInfo);
  return search;
}

model::SearchRequest AcquisitionQueue::CancelSearch(MarketContext& ctx, const std::string& search_id,
                                                    const std::string& requester_id) {
  auto it = ctx.searches.find(search_id);
  if (it == ctx.searches.end()) {
    NotifyAndThrow<util::NotFound>(ctx, requester_id, "Search " + search_id + " not found");
  }
  if (it->second.requester_id != requester_id) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Search " + search_id + " belongs to another requester");
  }

  it->second.status = SearchStatus::kCancelled;
  auto search       = it->second;

  for (const auto& listing_id : search.result_ids) {
    market::RetireListing(ctx, listing_id, ListingStatus::kWithdrawn);
  }
  ctx.searches.erase(search_id);

  USEDGEAR_LOG_INFO("Search cancelled", {StringField("search_id", search_id), StringField("requester_id", requester_id)});
  ctx.Notify(requester_id, "Search " + search_id + " cancelled; the retainer is not refunded", Severity::kInfo);
  return search;
}

std::vector<model::SearchRequest> AcquisitionQueue::ActiveSearches(const MarketContext& ctx,
                                                                   const std::string& requester_id) const {
  std::vector<model::SearchRequest> out;
  for (const auto& [id, search] : ctx.searches) {
    if (search.requester_id == requester_id) out.push_back(search);
  }
  return out;
}

model::ListingRecord& AcquisitionQueue::RequireOpenListing(MarketContext& ctx, const std::string& listing_id,
                                                           const std::string& actor) {
  auto& listing = market::RequireLiveListing(ctx, listing_id, actor);
  if (listing.origin != model::ListingOrigin::kSearch) {
    NotifyAndThrow<util::ValidationError>(ctx, actor, "Listing " + listing_id + " is not open to buyers");
  }
  if (listing.owner_id != actor) {
    NotifyAndThrow<util::ValidationError>(ctx, actor, "Listing " + listing_id + " belongs to another requester");
  }
  if (listing.status != ListingStatus::kFound && listing.status != ListingStatus::kNegotiating) {
    NotifyAndThrow<util::ValidationError>(ctx, actor, "Listing " + listing_id + " is not open for offers");
  }
  return listing;
}

model::ListingView AcquisitionQueue::ViewListing(MarketContext& ctx, const std::string& listing_id,
                                                 const std::string& requester_id) {
  auto& listing = market::RequireLiveListing(ctx, listing_id, requester_id);
  if (listing.owner_id != requester_id) {
    NotifyAndThrow<util::ValidationError>(ctx, requester_id, "Listing " + listing_id + " belongs to another requester");
  }

  if (listing.origin == model::ListingOrigin::kSearch && !listing.viewed) {
    listing.viewed = true;
    USEDGEAR_LOG_DEBUG("Listing viewed, offer window started",
                       {StringField("listing_id", listing_id), IntField("ttl_hours", listing.ttl_hours)});
  }
  return model::MakeView(listing);
}

void AcquisitionQueue::CompletePurchase(MarketContext& ctx, const model::ListingRecord& listing,
                                        const std::string& buyer_id, double price) {
  if (!ctx.host.ledger->Debit(buyer_id, price)) {
    NotifyAndThrow<util::FundsError>(ctx, buyer_id, "Not enough money to pay " + Money(price) + " for " + listing.category_name);
  }

  const auto listing_id = listing.id;
  const auto name       = listing.category_name;
  market::RetireListing(ctx, listing_id, ListingStatus::kSold);

  USEDGEAR_LOG_INFO("Listing purchased", {StringField("listing_id", listing_id), StringField("buyer_id", buyer_id),
                                          DoubleField("price", price)});
  ctx.Notify(buyer_id, "Bought " + name + " for " + Money(price), Severity::kOk);
}

PurchaseResult AcquisitionQueue::Purchase(MarketContext& ctx, const std::string& listing_id, const std::string& buyer_id) {
  auto& listing = RequireOpenListing(ctx, listing_id, buyer_id);

  PurchaseResult result;
  result.price_paid     = model::CurrentAsk(listing);
  result.listing        = model::MakeView(listing);
  result.listing.status = ListingStatus::kSold;

  CompletePurchase(ctx, listing, buyer_id, result.price_paid);
  return result;
}

OfferResult AcquisitionQueue::ApplyOutcome(MarketContext& ctx, model::ListingRecord& listing, const std::string& buyer_id,
                                           const model::NegotiationRecord& updated,
                                           const negotiation::NegotiationOutcome& outcome) {
  OfferResult result;
  result.outcome     = outcome;
  result.listing_id  = listing.id;
  result.personality = updated.personality;

  switch (outcome.kind) {
    case OutcomeKind::kAccepted:
      CompletePurchase(ctx, listing, buyer_id, outcome.price);
      result.listing_status = ListingStatus::kSold;
      result.price_paid     = outcome.price;
      return result;

    case OutcomeKind::kWalkedAway: {
      const auto name = listing.category_name;
      USEDGEAR_LOG_WARN("Seller walked away", {StringField("listing_id", listing.id),
                                               StringField("personality", model::ToString(updated.personality)),
                                               DoubleField("gap", outcome.gap)});
      market::RetireListing(ctx, result.listing_id, ListingStatus::kWithdrawn);
      ctx.Notify(buyer_id, "The seller of " + name + " walked away. The listing is gone.", Severity::kCritical);
      result.listing_status = ListingStatus::kWithdrawn;
      return result;
    }

    case OutcomeKind::kCountered:
    case OutcomeKind::kRejected:
      break;
  }

  listing.negotiation   = updated;
  listing.status        = ListingStatus::kNegotiating;
  result.listing_status = listing.status;

  USEDGEAR_LOG_INFO("Negotiation round", {StringField("listing_id", listing.id),
                                          StringField("personality", model::ToString(updated.personality)),
                                          StringField("outcome", model::ToString(outcome.kind)),
                                          DoubleField("gap", outcome.gap), IntField("round", updated.round)});
  ctx.Notify(buyer_id, outcome.message, outcome.kind == OutcomeKind::kCountered ? Severity::kInfo : Severity::kWarning);
  return result;
}

OfferResult AcquisitionQueue::SubmitOffer(MarketContext& ctx, const std::string& listing_id,
                                          const std::string& offerer_id, double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    NotifyAndThrow<util::ValidationError>(ctx, offerer_id, "Offer must be a positive amount");
  }

  auto& listing = RequireOpenListing(ctx, listing_id, offerer_id);

  auto record = listing.negotiation ? *listing.negotiation
                                    : negotiation::MakeNegotiationRecord(ctx.tables, listing.PrivilegedHidden().dna);
  if (record.locked_until_hour > ctx.clock.Now()) {
    NotifyAndThrow<util::ValidationError>(ctx, offerer_id, "The seller is not taking offers right now");
  }

  negotiation::NegotiationEngine engine(ctx.tables);
  const auto outcome = engine.Evaluate(record, listing, amount, ctx.host.weather->Current(), ctx.clock.Now(), ctx.rng);
  return ApplyOutcome(ctx, listing, offerer_id, record, outcome);
}

OfferResult AcquisitionQueue::AcceptCounter(MarketContext& ctx, const std::string& listing_id,
                                            const std::string& buyer_id) {
  auto& listing = RequireOpenListing(ctx, listing_id, buyer_id);
  if (!listing.negotiation || listing.negotiation->state != NegotiationState::kCountered) {
    NotifyAndThrow<util::ValidationError>(ctx, buyer_id, "There is no counter offer to accept on " + listing_id);
  }

  auto record = *listing.negotiation;

  negotiation::NegotiationOutcome outcome;
  outcome.kind    = OutcomeKind::kAccepted;
  outcome.offer   = record.counter_price;
  outcome.price   = record.counter_price;
  outcome.message = "Counter offer accepted at " + Money(record.counter_price);
  record.state    = NegotiationState::kAwaitingOffer;

  return ApplyOutcome(ctx, listing, buyer_id, record, outcome);
}

OfferResult AcquisitionQueue::StandFirm(MarketContext& ctx, const std::string& listing_id, const std::string& buyer_id) {
  auto& listing = RequireOpenListing(ctx, listing_id, buyer_id);
  if (!listing.negotiation || listing.negotiation->state != NegotiationState::kCountered) {
    NotifyAndThrow<util::ValidationError>(ctx, buyer_id, "There is no counter offer to stand firm against on " + listing_id);
  }

  auto record = *listing.negotiation;

  negotiation::NegotiationEngine engine(ctx.tables);
  const auto outcome = engine.StandFirm(record, listing, ctx.clock.Now(), ctx.rng);
  return ApplyOutcome(ctx, listing, buyer_id, record, outcome);
}

void AcquisitionQueue::ResolveSearch(MarketContext& ctx, model::SearchRequest& search) {
  const auto& agent_spec   = ctx.tables.Search(search.agent_tier);
  const auto& quality_spec = ctx.tables.Quality(search.quality_tier);
  const double chance =
      std::clamp(agent_spec.success_chance + quality_spec.search_success_modifier, kMinSearchSuccess, kMaxSearchSuccess);

  if (!ctx.rng.Chance(chance)) {
    search.status    = SearchStatus::kFailed;
    search.ttl_hours = ctx.tables.found_listing_window_hours;
    USEDGEAR_LOG_INFO("Search failed", {StringField("search_id", search.id), DoubleField("chance", chance)});
    ctx.Notify(search.requester_id,
               fmt::format("Your agent could not find {} this time; renew within {} hours to search again",
                           search.category.name, search.ttl_hours),
               Severity::kWarning);
    return;
  }

  condition::ConditionGenerator generator(ctx.tables);
  for (std::uint32_t i = 0; i < search.find_count; ++i) {
    const auto generated =
        generator.Generate(ctx.rng, search.quality_tier, search.agent_tier, search.category.base_price);

    model::ListingRecord listing(generated.hidden);
    listing.id              = ctx.ids.NextListingId();
    listing.category_id     = search.category.id;
    listing.category_name   = search.category.name;
    listing.owner_id        = search.requester_id;
    listing.source_id       = search.id;
    listing.origin          = model::ListingOrigin::kSearch;
    listing.quality_tier    = search.quality_tier;
    listing.status          = ListingStatus::kFound;
    listing.created_at_hour = ctx.clock.Now();
    listing.ttl_hours       = ctx.tables.found_listing_window_hours;
    listing.condition       = generated.visible;
    listing.base_price      = search.category.base_price;
    listing.price           = generated.price;
    listing.commission      = std::floor(generated.price * ctx.tables.commission_percent);
    listing.asking_price    = listing.price + listing.commission;
    listing.negotiation     = negotiation::MakeNegotiationRecord(ctx.tables, generated.hidden.dna);

    search.result_ids.push_back(listing.id);
    ctx.listings.Insert(std::move(listing));
  }

  search.status = SearchStatus::kSucceeded;
  USEDGEAR_LOG_INFO("Search succeeded", {StringField("search_id", search.id), IntField("found", search.find_count)});
  ctx.Notify(search.requester_id,
             fmt::format("Your agent found {} listing(s) for {}", search.find_count, search.category.name), Severity::kOk);
}

void AcquisitionQueue::OnHourTick(MarketContext& ctx, std::uint64_t elapsed_hours) {
  if (elapsed_hours == 0) return;
  const auto step = static_cast<std::uint32_t>(std::min<std::uint64_t>(elapsed_hours, std::numeric_limits<std::uint32_t>::max()));

  // A failed search stays renewable for the found-listing window.
  std::vector<std::string> lapsed;
  for (auto& [id, search] : ctx.searches) {
    if (search.status != SearchStatus::kActive && search.status != SearchStatus::kFailed) continue;
    search.ttl_hours = search.ttl_hours > step ? search.ttl_hours - step : 0;
    if (search.ttl_hours > 0) continue;

    if (search.status == SearchStatus::kFailed) {
      lapsed.push_back(id);
      continue;
    }
    ResolveSearch(ctx, search);
  }
  for (const auto& id : lapsed) {
    USEDGEAR_LOG_DEBUG("Failed search dropped", {StringField("search_id", id)});
    ctx.searches.erase(id);
  }

  // Found listings age only once viewed, and never while held.
  std::vector<std::string> expired;
  for (auto& [id, listing] : ctx.listings.Live()) {
    if (listing.origin != model::ListingOrigin::kSearch || !listing.viewed || listing.on_hold) continue;
    listing.ttl_hours = listing.ttl_hours > step ? listing.ttl_hours - step : 0;
    if (listing.ttl_hours == 0) expired.push_back(id);
  }
  for (const auto& id : expired) {
    const auto* listing = ctx.listings.Find(id);
    const auto  owner   = listing->owner_id;
    const auto  name    = listing->category_name;
    market::RetireListing(ctx, id, ListingStatus::kExpired);
    USEDGEAR_LOG_INFO("Found listing expired", {StringField("listing_id", id)});
    ctx.Notify(owner, "The offer window for " + name + " closed", Severity::kWarning);
  }
}

} // namespace usedgear::acquisition
