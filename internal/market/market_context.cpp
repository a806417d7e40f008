#include "market_context.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace usedgear::market {

using observability::StringField;

MarketContext::MarketContext(MarketTables tables_in, host::HostPorts host_in, std::uint64_t seed)
    : tables(std::move(tables_in)), host(std::move(host_in)), rng(seed) {
  if (!host.ledger || !host.weather || !host.notifications) {
    throw std::invalid_argument("market context needs ledger, weather and notification ports");
  }
}

void MarketContext::Notify(const std::string& owner_id, const std::string& message, host::Severity severity) {
  host.notifications->Notify(owner_id, message, severity);
}

void MarketContext::Reset() {
  clock.Restore(0, 0);
  ids = util::IdGenerator{};
  listings.Clear();
  searches.clear();
  sales.clear();
  inspections.clear();
  for (const auto& hold : holds.All()) {
    holds.Remove(hold.hold_id);
  }
}

void RetireListing(MarketContext& ctx, const std::string& listing_id, model::ListingStatus terminal) {
  auto* listing = ctx.listings.Find(listing_id);
  if (listing == nullptr) return;

  const auto origin    = listing->origin;
  const auto source_id = listing->source_id;

  ctx.listings.Resolve(listing_id, terminal, ctx.clock.Period());
  ctx.holds.RemoveAll(listing_id);
  ctx.inspections.erase(listing_id);

  USEDGEAR_LOG_DEBUG("Listing retired", {StringField("listing_id", listing_id), StringField("status", model::ToString(terminal))});

  if (origin != model::ListingOrigin::kSearch) return;

  auto search_it = ctx.searches.find(source_id);
  if (search_it == ctx.searches.end() || search_it->second.status != model::SearchStatus::kSucceeded) return;

  const auto& results = search_it->second.result_ids;
  const bool  any_live =
      std::any_of(results.begin(), results.end(), [&](const std::string& id) { return ctx.listings.Find(id) != nullptr; });
  if (!any_live) {
    USEDGEAR_LOG_DEBUG("Search results consumed", {StringField("search_id", source_id)});
    ctx.searches.erase(search_it);
  }
}

model::ListingRecord& RequireLiveListing(MarketContext& ctx, const std::string& listing_id, const std::string& actor) {
  if (auto* listing = ctx.listings.Find(listing_id)) {
    return *listing;
  }
  if (auto tombstone = ctx.listings.TombstoneFor(listing_id)) {
    NotifyAndThrow<util::RaceRejection>(
        ctx, actor, "Listing " + listing_id + " was already handled (" + std::string(model::ToString(tombstone->status)) + ")");
  }
  NotifyAndThrow<util::NotFound>(ctx, actor, "Listing " + listing_id + " not found");
}

} // namespace usedgear::market
