#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/host/host_ports.hpp"
#include "internal/inspection/hold_table.hpp"
#include "internal/market/listing_store.hpp"
#include "internal/market/tier_tables.hpp"
#include "internal/model/inspection.hpp"
#include "internal/model/sale_request.hpp"
#include "internal/model/search_request.hpp"
#include "internal/util/id_generator.hpp"
#include "internal/util/random.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::market {

/*
  Everything one market instance owns.

  Engine components are stateless and act on a MarketContext passed in,
  so two contexts never share listings, clocks or random streams. Not
  thread-safe; the service layer serializes access.
*/
struct MarketContext {
  MarketContext(MarketTables tables, host::HostPorts host, std::uint64_t seed);

  MarketTables    tables;
  host::HostPorts host;

  util::SimClock    clock;
  util::Random      rng;
  util::IdGenerator ids;

  ListingStore                                    listings;
  std::map<std::string, model::SearchRequest>     searches;    // by search id
  std::map<std::string, model::SaleRequest>       sales;       // by sale id
  std::map<std::string, model::InspectionRecord>  inspections; // by listing id
  inspection::HoldTable                           holds;

  void Notify(const std::string& owner_id, const std::string& message, host::Severity severity);

  // Drops all market state; tables, host and random stream are kept.
  void Reset();
};

// Removes a listing from the market for good: tombstone, holds,
// inspection, and the producing search once all its results are gone.
void RetireListing(MarketContext& ctx, const std::string& listing_id, model::ListingStatus terminal);

// Live listing or throws: RaceRejection (after notifying `actor`) for a
// resolved listing, NotFound for an unknown id.
model::ListingRecord& RequireLiveListing(MarketContext& ctx, const std::string& listing_id, const std::string& actor);

// Every rejected operation reaches the requester as a notification before
// the error propagates.
template <typename Error>
[[noreturn]] void NotifyAndThrow(MarketContext& ctx, const std::string& owner_id, const std::string& message) {
  ctx.Notify(owner_id, message, host::Severity::kWarning);
  throw Error(message);
}

} // namespace usedgear::market
