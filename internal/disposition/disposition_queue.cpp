#include "disposition_queue.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

#include "internal/condition/condition_generator.hpp"
#include "internal/negotiation/personality.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::disposition {

using host::Severity;
using market::MarketContext;
using market::NotifyAndThrow;
using model::ListingStatus;
using model::SaleStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Money(double amount) {
  return fmt::format("${:.0f}", amount);
}

std::uint32_t Countdown(std::uint32_t remaining, std::uint32_t step) {
  return remaining > step ? remaining - step : 0;
}

} // namespace

double DispositionQueue::CycleSuccessChance(const market::MarketTables& tables, const model::SaleRequest& sale) {
  double chance = tables.Sale(sale.agent_tier).success_chance;
  if (sale.asking_price > 0.0 && sale.expected_max > 0.0 && sale.asking_price > sale.expected_max) {
    chance *= sale.expected_max / sale.asking_price;
  }
  return std::clamp(chance, 0.0, 1.0);
}

model::SaleRequest DispositionQueue::ListForSale(MarketContext& ctx, const std::string& owner_id,
                                                 const model::OwnedItem& item, std::int64_t agent_index) {
  if (owner_id.empty()) {
    throw util::ValidationError("owner id is required");
  }

  const auto agent = model::AgentTierFromIndex(agent_index);
  if (!agent) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, fmt::format("Agent tier {} does not exist", agent_index));
  }
  if (item.item_id.empty()) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Item to sell has no id");
  }
  if (!std::isfinite(item.vanilla_value) || item.vanilla_value <= 0.0) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Item " + item.item_id + " has no sale value");
  }
  const bool already_listed = std::any_of(ctx.sales.begin(), ctx.sales.end(),
                                          [&](const auto& entry) { return entry.second.item.item_id == item.item_id; });
  if (already_listed) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Item " + item.item_id + " is already listed for sale");
  }

  const auto& spec = ctx.tables.Sale(*agent);
  const double fee = market::SaleAgentFee(spec, item.vanilla_value);

  if (!ctx.host.ledger->Debit(owner_id, fee)) {
    NotifyAndThrow<util::FundsError>(ctx, owner_id, "Not enough money for the " + Money(fee) + " agent fee");
  }

  model::VisibleCondition visible;
  visible.age_years       = item.age_years;
  visible.damage          = item.damage;
  visible.wear            = item.wear;
  visible.operating_hours = item.operating_hours;

  condition::ConditionGenerator generator(ctx.tables);
  const auto hidden = generator.DeriveHidden(ctx.rng, visible);

  model::SaleRequest sale;
  sale.id                = ctx.ids.NextSaleId();
  sale.owner_id          = owner_id;
  sale.listing_id        = ctx.ids.NextListingId();
  sale.item              = item;
  sale.agent_tier        = *agent;
  sale.fee_paid          = fee;
  sale.created_at_hour   = ctx.clock.Now();
  sale.expected_min      = std::floor(item.vanilla_value * spec.return_range.min);
  sale.expected_max      = std::floor(item.vanilla_value * spec.return_range.max);
  sale.hours_until_cycle = spec.offer_cycle_hours;

  model::ListingRecord listing(hidden);
  listing.id              = sale.listing_id;
  listing.category_id     = item.category_id;
  listing.category_name   = item.name;
  listing.owner_id        = owner_id;
  listing.source_id       = sale.id;
  listing.origin          = model::ListingOrigin::kSale;
  listing.status          = ListingStatus::kSearching;
  listing.created_at_hour = sale.created_at_hour;
  listing.ttl_hours       = spec.listing_lifetime_hours;
  listing.viewed          = true;
  listing.condition       = visible;
  listing.base_price      = item.base_price;
  listing.price           = item.vanilla_value;
  listing.negotiation     = negotiation::MakeNegotiationRecord(ctx.tables, hidden.dna);

  ctx.listings.Insert(std::move(listing));
  ctx.sales[sale.id] = sale;

  USEDGEAR_LOG_INFO("Item listed for sale", {StringField("sale_id", sale.id), StringField("owner_id", owner_id),
                                             StringField("item_id", item.item_id), StringField("agent", model::ToString(*agent)),
                                             DoubleField("fee", fee)});
  ctx.Notify(owner_id,
             fmt::format("{} agent is selling {} (expected {} to {})", spec.name, item.name, Money(sale.expected_min),
                         Money(sale.expected_max)),
             Severity::kInfo);
  return sale;
}

model::SaleRequest& DispositionQueue::RequireSale(MarketContext& ctx, const std::string& sale_id,
                                                  const std::string& owner_id) {
  auto it = ctx.sales.find(sale_id);
  if (it == ctx.sales.end()) {
    NotifyAndThrow<util::NotFound>(ctx, owner_id, "Sale " + sale_id + " not found");
  }
  if (it->second.owner_id != owner_id) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Sale " + sale_id + " belongs to another owner");
  }
  return it->second;
}

model::SaleRequest& DispositionQueue::RequirePendingSale(MarketContext& ctx, const std::string& listing_id,
                                                         const std::string& owner_id) {
  const auto& listing = market::RequireLiveListing(ctx, listing_id, owner_id);
  if (listing.origin != model::ListingOrigin::kSale) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Listing " + listing_id + " is not a sale listing");
  }

  auto& sale = RequireSale(ctx, listing.source_id, owner_id);
  if (sale.status != SaleStatus::kOfferPending || !sale.pending_offer) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "There is no pending offer on " + listing_id);
  }
  return sale;
}

CancelSaleResult DispositionQueue::CancelSale(MarketContext& ctx, const std::string& sale_id, const std::string& owner_id) {
  auto& sale = RequireSale(ctx, sale_id, owner_id);
  if (sale.status == SaleStatus::kOfferPending) {
    NotifyAndThrow<util::ValidationError>(ctx, owner_id, "Accept or decline the pending offer before cancelling");
  }

  sale.status = SaleStatus::kCancelled;

  CancelSaleResult result;
  result.sale          = sale;
  result.returned_item = sale.item;

  market::RetireListing(ctx, sale.listing_id, ListingStatus::kWithdrawn);
  ctx.sales.erase(sale_id);

  USEDGEAR_LOG_INFO("Sale cancelled", {StringField("sale_id", sale_id), DoubleField("fee_forfeited", result.sale.fee_paid)});
  ctx.Notify(owner_id,
             result.returned_item.name + " is back in your inventory; the " + Money(result.sale.fee_paid) +
                 " agent fee is not refunded",
             Severity::kInfo);
  return result;
}

AcceptOfferResult DispositionQueue::AcceptOffer(MarketContext& ctx, const std::string& listing_id,
                                                const std::string& owner_id) {
  auto&        sale   = RequirePendingSale(ctx, listing_id, owner_id);
  const double amount = sale.pending_offer->amount;

  if (!ctx.host.ledger->Credit(owner_id, amount)) {
    NotifyAndThrow<util::FundsError>(ctx, owner_id, "The ledger refused the " + Money(amount) + " payout");
  }

  auto entry      = *sale.pending_offer;
  entry.accepted  = true;
  entry.responded = true;
  sale.offers.push_back(entry);
  sale.pending_offer.reset();
  sale.pending_offer_hours_remaining = 0;
  sale.status                        = SaleStatus::kSold;

  AcceptOfferResult result;
  result.sale     = sale;
  result.proceeds = amount;

  const auto sale_id = sale.id;
  market::RetireListing(ctx, listing_id, ListingStatus::kSold);
  ctx.sales.erase(sale_id);

  USEDGEAR_LOG_INFO("Sale offer accepted", {StringField("sale_id", sale_id), DoubleField("proceeds", amount)});
  ctx.Notify(owner_id, "Sold " + result.sale.item.name + " for " + Money(amount), Severity::kOk);
  return result;
}

model::SaleRequest DispositionQueue::DeclineOffer(MarketContext& ctx, const std::string& listing_id,
                                                  const std::string& owner_id) {
  auto& sale    = RequirePendingSale(ctx, listing_id, owner_id);
  auto* listing = ctx.listings.Find(listing_id);

  auto entry      = *sale.pending_offer;
  entry.responded = true;
  sale.offers.push_back(entry);
  sale.pending_offer.reset();
  sale.pending_offer_hours_remaining = 0;
  sale.offers_declined += 1;
  sale.status            = SaleStatus::kSearching;
  sale.hours_until_cycle = ctx.tables.Sale(sale.agent_tier).offer_cycle_hours;
  listing->status        = ListingStatus::kSearching;

  USEDGEAR_LOG_INFO("Sale offer declined", {StringField("sale_id", sale.id), DoubleField("amount", entry.amount)});
  if (listing->ttl_hours > 0) {
    ctx.Notify(owner_id, "Offer of " + Money(entry.amount) + " declined; the agent keeps looking", Severity::kInfo);
    return sale;
  }

  // The listing outlived its lifetime only to hold this offer open.
  auto closed   = sale;
  closed.status = SaleStatus::kExpired;
  ctx.Notify(owner_id, "Offer of " + Money(entry.amount) + " declined", Severity::kInfo);
  Expire(ctx, closed.id);
  return closed;
}

model::SaleRequest DispositionQueue::ModifyAskingPrice(MarketContext& ctx, const std::string& sale_id,
                                                       const std::string& owner_id, double asking_price) {
  if (!std::isfinite(asking_price) || asking_price <= 0.0 || asking_price > ctx.tables.max_asking_price) {
    NotifyAndThrow<util::ValidationError>(
        ctx, owner_id, fmt::format("Asking price must be between $1 and {}", Money(ctx.tables.max_asking_price)));
  }

  auto& sale        = RequireSale(ctx, sale_id, owner_id);
  sale.asking_price = asking_price;
  if (auto* listing = ctx.listings.Find(sale.listing_id)) {
    listing->asking_price = asking_price;
  }

  USEDGEAR_LOG_INFO("Sale asking price changed", {StringField("sale_id", sale_id), DoubleField("asking_price", asking_price)});
  if (asking_price > sale.expected_max) {
    ctx.Notify(owner_id, "Asking " + Money(asking_price) + " is above what buyers expect; offers will be rarer",
               Severity::kWarning);
  }
  return sale;
}

std::vector<model::SaleRequest> DispositionQueue::Sales(const MarketContext& ctx, const std::string& owner_id) const {
  std::vector<model::SaleRequest> out;
  for (const auto& [id, sale] : ctx.sales) {
    if (sale.owner_id == owner_id) out.push_back(sale);
  }
  return out;
}

void DispositionQueue::GenerateOffer(MarketContext& ctx, model::SaleRequest& sale, model::ListingRecord& listing) {
  const auto&  spec   = ctx.tables.Sale(sale.agent_tier);
  const double chance = CycleSuccessChance(ctx.tables, sale);

  if (!ctx.rng.Chance(chance)) {
    USEDGEAR_LOG_DEBUG("Sale cycle found no buyer", {StringField("sale_id", sale.id), DoubleField("chance", chance)});
    return;
  }

  double amount = std::floor(sale.item.vanilla_value * ctx.rng.Uniform(spec.return_range.min, spec.return_range.max));
  if (sale.asking_price > 0.0) amount = std::min(amount, sale.asking_price);

  model::OfferEntry offer;
  offer.amount  = amount;
  offer.at_hour = ctx.clock.Now();

  sale.pending_offer                 = offer;
  sale.pending_offer_hours_remaining = ctx.tables.sale_offer_window_hours;
  sale.status                        = SaleStatus::kOfferPending;
  sale.offers_received += 1;
  listing.status = ListingStatus::kNegotiating;

  USEDGEAR_LOG_INFO("Buyer offer generated", {StringField("sale_id", sale.id), DoubleField("amount", amount)});
  ctx.Notify(sale.owner_id,
             fmt::format("A buyer offers {} for {}; respond within {} hours", Money(amount), sale.item.name,
                         ctx.tables.sale_offer_window_hours),
             Severity::kOk);
}

void DispositionQueue::LapseOffer(MarketContext& ctx, model::SaleRequest& sale, model::ListingRecord& listing) {
  auto entry = *sale.pending_offer;
  sale.offers.push_back(entry);
  sale.pending_offer.reset();
  sale.pending_offer_hours_remaining = 0;
  sale.offers_declined += 1;
  sale.status            = SaleStatus::kSearching;
  sale.hours_until_cycle = ctx.tables.Sale(sale.agent_tier).offer_cycle_hours;
  listing.status         = ListingStatus::kSearching;

  USEDGEAR_LOG_INFO("Buyer offer lapsed", {StringField("sale_id", sale.id), DoubleField("amount", entry.amount)});
  ctx.Notify(sale.owner_id, "The " + Money(entry.amount) + " offer for " + sale.item.name + " lapsed", Severity::kWarning);
}

void DispositionQueue::Expire(MarketContext& ctx, const std::string& sale_id) {
  auto it = ctx.sales.find(sale_id);
  if (it == ctx.sales.end()) return;

  const auto owner = it->second.owner_id;
  const auto name  = it->second.item.name;
  market::RetireListing(ctx, it->second.listing_id, ListingStatus::kExpired);
  ctx.sales.erase(it);

  USEDGEAR_LOG_INFO("Sale listing expired", {StringField("sale_id", sale_id)});
  ctx.Notify(owner, "The agent could not sell " + name + "; it is back in your inventory", Severity::kWarning);
}

void DispositionQueue::OnHourTick(MarketContext& ctx, std::uint64_t elapsed_hours) {
  if (elapsed_hours == 0) return;
  const auto step = static_cast<std::uint32_t>(std::min<std::uint64_t>(elapsed_hours, std::numeric_limits<std::uint32_t>::max()));

  std::vector<std::string> expired;
  for (auto& [id, sale] : ctx.sales) {
    auto* listing = ctx.listings.Find(sale.listing_id);
    if (listing == nullptr) {
      USEDGEAR_LOG_WARN("Sale without a live listing", {StringField("sale_id", id), StringField("listing_id", sale.listing_id)});
      expired.push_back(id);
      continue;
    }

    if (!listing->on_hold) {
      listing->ttl_hours = Countdown(listing->ttl_hours, step);
    }

    // A pending offer keeps the sale open past its lifetime until the
    // owner answers or the offer window lapses.
    if (sale.status == SaleStatus::kOfferPending) {
      sale.pending_offer_hours_remaining = Countdown(sale.pending_offer_hours_remaining, step);
      if (sale.pending_offer_hours_remaining == 0) {
        LapseOffer(ctx, sale, *listing);
        if (listing->ttl_hours == 0) expired.push_back(id);
      }
      continue;
    }

    if (listing->ttl_hours == 0) {
      expired.push_back(id);
      continue;
    }

    sale.hours_until_cycle = Countdown(sale.hours_until_cycle, step);
    if (sale.hours_until_cycle > 0) continue;

    sale.hours_until_cycle = ctx.tables.Sale(sale.agent_tier).offer_cycle_hours;
    GenerateOffer(ctx, sale, *listing);
  }

  for (const auto& id : expired) {
    Expire(ctx, id);
  }
}

void DispositionQueue::OnPeriodTick(MarketContext& ctx) {
  struct Digest {
    std::uint32_t live    = 0;
    std::uint32_t pending = 0;
  };
  std::map<std::string, Digest> digests;

  for (auto& [id, sale] : ctx.sales) {
    sale.months_listed += 1;
    auto& digest = digests[sale.owner_id];
    digest.live += 1;
    if (sale.status == SaleStatus::kOfferPending) digest.pending += 1;
  }

  for (const auto& [owner, digest] : digests) {
    ctx.Notify(owner, fmt::format("Monthly sales report: {} item(s) listed, {} offer(s) awaiting your answer", digest.live,
                                  digest.pending),
               Severity::kInfo);
  }
  USEDGEAR_LOG_DEBUG("Sale period advanced", {IntField("sales", static_cast<std::int64_t>(ctx.sales.size()))});
}

} // namespace usedgear::disposition
