#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/host/standalone_host.hpp"
#include "internal/market/market_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/market_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sim_clock.hpp"
#include "usedgear/market/v1.hpp"

using namespace usedgear::market::v1;

/*
  Headless market run: one player searches for equipment, haggles over
  what turns up, and puts an owned machine up for sale while the clock
  runs for the requested number of hours.
*/

namespace {

constexpr const char* kPlayer = "player";

struct Options {
  std::string   config_path;
  std::uint64_t hours = 24 * 14;
  std::uint64_t seed  = 0;
  bool          save  = false;
  int           max_renewals = 2;
};

void Usage() {
  std::cout << "Usage:\n"
            << "  usedgear-sim [--config <config.yaml>] [--hours <n>] [--seed <n>] [--save]\n";
}

bool ParseUnsigned(const char* text, std::uint64_t* out) {
  char* end = nullptr;
  auto  v   = std::strtoull(text, &end, 10);
  if (end == text || *end != '\0') return false;
  *out = v;
  return true;
}

bool ParseArgs(int argc, char** argv, Options* opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts->config_path = argv[++i];
    } else if (arg == "--hours" && i + 1 < argc) {
      if (!ParseUnsigned(argv[++i], &opts->hours)) return false;
    } else if (arg == "--seed" && i + 1 < argc) {
      if (!ParseUnsigned(argv[++i], &opts->seed)) return false;
    } else if (arg == "--save") {
      opts->save = true;
    } else {
      return false;
    }
  }
  return true;
}

void Print(const Notification& n) {
  std::cout << "  [" << Severity_Name(n.severity()) << "] " << n.owner_id() << ": " << n.message() << "\n";
}

void PrintListing(const ListingView& l) {
  std::cout << "  " << l.id() << " " << l.category_name() << " age=" << l.age_years() << "y damage=" << std::fixed
            << std::setprecision(2) << l.damage() << " ask=$" << std::setprecision(0) << l.current_ask()
            << " ttl=" << l.ttl_hours() << "h\n";
}

// Offers 85% of the ask, then takes a counter if the seller makes one.
void Haggle(usedgear::service::MarketService& svc, const ListingView& listing) {
  SubmitOfferRequest offer;
  offer.set_listing_id(listing.id());
  offer.set_offerer_id(kPlayer);
  offer.set_amount(std::floor(listing.current_ask() * 0.85));

  try {
    const auto outcome = svc.SubmitOffer(offer).outcome();
    std::cout << "  offer on " << listing.id() << ": " << OutcomeKind_Name(outcome.kind()) << " - " << outcome.message()
              << "\n";
    if (outcome.kind() == OUTCOME_KIND_COUNTERED) {
      AcceptCounterRequest accept;
      accept.set_listing_id(listing.id());
      accept.set_buyer_id(kPlayer);
      const auto accepted = svc.AcceptCounter(accept).outcome();
      std::cout << "  counter accepted, paid $" << std::setprecision(0) << accepted.price_paid() << "\n";
    }
  } catch (const usedgear::util::FundsError& e) {
    std::cout << "  cannot afford " << listing.id() << ": " << e.what() << "\n";
  } catch (const usedgear::util::RaceRejection& e) {
    std::cout << "  " << e.what() << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!ParseArgs(argc, argv, &opts)) {
    Usage();
    return 1;
  }

  try {
    auto config = opts.config_path.empty() ? usedgear::config::ConfigLoader::Defaults()
                                           : usedgear::config::ConfigLoader::LoadFromYaml(opts.config_path);
    if (opts.seed != 0) config.mutable_market()->set_random_seed(opts.seed);

    usedgear::observability::InitializeLogging(config);
    auto  app = usedgear::factory::Build(config);
    auto& svc = *app.service;

    RequestSearchRequest search;
    search.set_requester_id(kPlayer);
    search.mutable_category()->set_id("excavator");
    search.mutable_category()->set_name("Excavator");
    search.mutable_category()->set_base_price(120000);
    search.set_quality_tier(4);
    search.set_agent_tier(2);
    std::cout << "search " << svc.RequestSearch(search).search().id() << " started\n";

    ListForSaleRequest sale;
    sale.set_owner_id(kPlayer);
    sale.mutable_item()->set_item_id("tractor-1");
    sale.mutable_item()->set_category_id("tractor");
    sale.mutable_item()->set_name("Old Tractor");
    sale.mutable_item()->set_vanilla_value(40000);
    sale.mutable_item()->set_base_price(60000);
    sale.mutable_item()->set_age_years(9);
    sale.mutable_item()->set_damage(0.2);
    sale.mutable_item()->set_wear(0.35);
    sale.mutable_item()->set_operating_hours(6400);
    sale.set_agent_tier(1);
    std::cout << "sale " << svc.ListForSale(sale).sale().id() << " listed\n";

    int                 renewals = 0;
    const std::uint64_t start    = app.market->clock.Now();
    for (std::uint64_t hour = start + 1; hour <= start + opts.hours; ++hour) {
      HourTickRequest tick;
      tick.set_hour(hour);
      const auto resp = svc.HourTick(tick);
      for (const auto& n : resp.notifications()) Print(n);

      if (hour % usedgear::util::kHoursPerPeriod == 0) {
        PeriodTickRequest period;
        period.set_period(static_cast<std::uint32_t>(hour / usedgear::util::kHoursPerPeriod));
        for (const auto& n : svc.PeriodTick(period).notifications()) Print(n);
      }

      GetActiveSearchesRequest searches;
      searches.set_requester_id(kPlayer);
      for (const auto& s : svc.GetActiveSearches(searches).searches()) {
        if (s.status() != SEARCH_STATUS_FAILED || renewals >= opts.max_renewals) continue;
        RenewSearchRequest renew;
        renew.set_search_id(s.id());
        renew.set_requester_id(kPlayer);
        ++renewals;
        try {
          std::cout << "hour " << hour << " renewed " << s.id() << " as " << svc.RenewSearch(renew).search().id() << "\n";
        } catch (const usedgear::util::FundsError& e) {
          std::cout << "hour " << hour << " could not renew " << s.id() << ": " << e.what() << "\n";
        } catch (const usedgear::util::LimitExceeded& e) {
          std::cout << "hour " << hour << " could not renew " << s.id() << ": " << e.what() << "\n";
        }
      }

      GetActiveListingsRequest mine;
      mine.set_requester_id(kPlayer);
      const auto active = svc.GetActiveListings(mine);
      for (const auto& listing : active.listings()) {
        if (listing.search_id().rfind("SEARCH_", 0) == 0 && !listing.viewed()) {
          ViewListingRequest view;
          view.set_listing_id(listing.id());
          view.set_requester_id(kPlayer);
          std::cout << "hour " << hour << " found:\n";
          PrintListing(svc.ViewListing(view).listing());
          Haggle(svc, listing);
        }
      }
      for (const auto& s : active.sales()) {
        if (s.status() == SALE_STATUS_OFFER_PENDING && s.pending_offer().amount() >= s.expected_min()) {
          AcceptOfferRequest accept;
          accept.set_listing_id(s.listing_id());
          accept.set_owner_id(kPlayer);
          std::cout << "hour " << hour << " sold " << s.item().name() << " for $" << std::setprecision(0)
                    << svc.AcceptOffer(accept).proceeds() << "\n";
        }
      }
    }

    for (const auto& n : svc.DrainNotifications({}).notifications()) Print(n);
    std::cout << "balance: $" << std::fixed << std::setprecision(0) << app.ledger->Balance(kPlayer) << "\n";

    if (opts.save) {
      std::cout << "snapshot: " << svc.SaveSnapshot({}).records_written() << " records\n";
    }
    usedgear::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    USEDGEAR_LOG_ERROR("Fatal error", {usedgear::observability::StringField("error", e.what())});
    usedgear::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
