#include "record_codec.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace usedgear::persistence {

using db::model::FlatRecord;

namespace {

// ---------------------------------------------------------------------
// Attribute writer / reader
// ---------------------------------------------------------------------

class Writer {
 public:
  Writer(const char* kind, std::string id) {
    record_.kind = kind;
    record_.id   = std::move(id);
  }

  void Text(const std::string& key, std::string_view value) {
    record_.attributes[key] = std::string(value);
  }
  void Number(const std::string& key, double value) {
    record_.attributes[key] = fmt::format("{}", value);
  }
  void Unsigned(const std::string& key, std::uint64_t value) {
    record_.attributes[key] = std::to_string(value);
  }
  void Bool(const std::string& key, bool value) {
    record_.attributes[key] = value ? "1" : "0";
  }

  FlatRecord Take() {
    return std::move(record_);
  }

 private:
  FlatRecord record_;
};

class Reader {
 public:
  explicit Reader(const FlatRecord& record) : record_(record) {
    if (record_.id.empty()) Fail("record has no id");
  }

  bool Has(const std::string& key) const {
    return record_.attributes.count(key) != 0;
  }

  std::string Required(const std::string& key) const {
    auto it = record_.attributes.find(key);
    if (it == record_.attributes.end() || it->second.empty()) Fail("missing required attribute " + key);
    return it->second;
  }

  std::string Text(const std::string& key, std::string fallback = {}) const {
    auto it = record_.attributes.find(key);
    return it == record_.attributes.end() ? fallback : it->second;
  }

  double Number(const std::string& key, double fallback = 0.0) const {
    auto it = record_.attributes.find(key);
    if (it == record_.attributes.end()) return fallback;

    const char* begin = it->second.c_str();
    char*       end   = nullptr;
    errno             = 0;
    const double v    = std::strtod(begin, &end);
    if (it->second.empty() || end != begin + it->second.size() || errno == ERANGE) Fail("bad number in " + key);
    return v;
  }

  std::uint64_t Unsigned(const std::string& key, std::uint64_t fallback = 0) const {
    auto it = record_.attributes.find(key);
    if (it == record_.attributes.end()) return fallback;

    const auto& s = it->second;
    if (s.empty() || s.front() == '-') Fail("bad integer in " + key);
    const char* begin = s.c_str();
    char*       end   = nullptr;
    errno             = 0;
    const auto v      = std::strtoull(begin, &end, 10);
    if (end != begin + s.size() || errno == ERANGE) Fail("bad integer in " + key);
    return static_cast<std::uint64_t>(v);
  }

  std::uint32_t Unsigned32(const std::string& key, std::uint32_t fallback = 0) const {
    const auto v = Unsigned(key, fallback);
    if (v > std::numeric_limits<std::uint32_t>::max()) Fail("integer out of range in " + key);
    return static_cast<std::uint32_t>(v);
  }

  bool Bool(const std::string& key, bool fallback = false) const {
    auto it = record_.attributes.find(key);
    if (it == record_.attributes.end()) return fallback;
    if (it->second == "1") return true;
    if (it->second == "0") return false;
    Fail("bad flag in " + key);
  }

  template <typename T>
  T Enum(const std::string& key, std::optional<T> (*parse)(std::string_view), T fallback) const {
    auto it = record_.attributes.find(key);
    if (it == record_.attributes.end()) return fallback;
    auto parsed = parse(it->second);
    if (!parsed) Fail("unknown value '" + it->second + "' in " + key);
    return *parsed;
  }

  template <typename T>
  T Tier(const std::string& key, std::optional<T> (*from_index)(std::int64_t), T fallback) const {
    if (!Has(key)) return fallback;
    auto parsed = from_index(static_cast<std::int64_t>(Unsigned(key)));
    if (!parsed) Fail("tier out of range in " + key);
    return *parsed;
  }

  const std::string& Id() const {
    return record_.id;
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw util::CorruptRecordError(record_.kind + " " + record_.id + ": " + what);
  }

 private:
  const FlatRecord& record_;
};

std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& v : values) {
    if (!out.empty()) out += ',';
    out += v;
  }
  return out;
}

std::vector<std::string> Split(const std::string& value) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start < value.size()) {
    auto comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    if (comma > start) out.push_back(value.substr(start, comma - start));
    start = comma + 1;
  }
  return out;
}

std::optional<model::ListingOrigin> OriginFromString(std::string_view value) {
  if (value == "search") return model::ListingOrigin::kSearch;
  if (value == "sale") return model::ListingOrigin::kSale;
  return std::nullopt;
}

std::optional<model::NegotiationState> NegotiationStateFromString(std::string_view value) {
  if (value == "awaiting_offer") return model::NegotiationState::kAwaitingOffer;
  if (value == "countered") return model::NegotiationState::kCountered;
  return std::nullopt;
}

std::optional<model::GenerationClass> GenerationFromIndex(std::int64_t index) {
  if (index < 0 || index >= static_cast<std::int64_t>(model::kGenerationCount)) return std::nullopt;
  return static_cast<model::GenerationClass>(index);
}

void WriteOffer(Writer& w, const std::string& prefix, const model::OfferEntry& offer) {
  w.Number(prefix + "amount", offer.amount);
  w.Unsigned(prefix + "at_hour", offer.at_hour);
  w.Bool(prefix + "accepted", offer.accepted);
  w.Bool(prefix + "responded", offer.responded);
}

model::OfferEntry ReadOffer(const Reader& r, const std::string& prefix) {
  model::OfferEntry offer;
  offer.amount    = r.Number(prefix + "amount");
  offer.at_hour   = r.Unsigned(prefix + "at_hour");
  offer.accepted  = r.Bool(prefix + "accepted");
  offer.responded = r.Bool(prefix + "responded");
  return offer;
}

} // namespace

// ---------------------------------------------------------------------
// Meta
// ---------------------------------------------------------------------

FlatRecord EncodeMeta(const EngineMeta& meta) {
  Writer w(kMetaKind, kMetaId);
  w.Unsigned("hour", meta.hour);
  w.Unsigned("period", meta.period);
  w.Unsigned("id_counter", meta.id_counter);
  w.Unsigned("seed", meta.seed);
  w.Text("rng_state", meta.rng_state);
  return w.Take();
}

EngineMeta DecodeMeta(const FlatRecord& record) {
  Reader     r(record);
  EngineMeta meta;
  meta.hour       = r.Unsigned("hour");
  meta.period     = r.Unsigned32("period");
  meta.id_counter = r.Unsigned("id_counter");
  meta.seed       = r.Unsigned("seed");
  meta.rng_state  = r.Text("rng_state");
  return meta;
}

// ---------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------

FlatRecord EncodeListing(const model::ListingRecord& l) {
  Writer w(kListingKind, l.id);
  w.Text("category_id", l.category_id);
  w.Text("category_name", l.category_name);
  w.Text("owner_id", l.owner_id);
  w.Text("source_id", l.source_id);
  w.Text("origin", l.origin == model::ListingOrigin::kSale ? "sale" : "search");
  w.Unsigned("quality_tier", static_cast<std::uint64_t>(l.quality_tier));
  w.Text("status", model::ToString(l.status));
  w.Unsigned("created_at_hour", l.created_at_hour);
  w.Unsigned("ttl_hours", l.ttl_hours);
  w.Bool("on_hold", l.on_hold);
  w.Bool("viewed", l.viewed);

  w.Unsigned("age_years", l.condition.age_years);
  w.Number("damage", l.condition.damage);
  w.Number("wear", l.condition.wear);
  w.Number("operating_hours", l.condition.operating_hours);
  w.Unsigned("generation", static_cast<std::uint64_t>(l.condition.generation));

  w.Number("base_price", l.base_price);
  w.Number("price", l.price);
  w.Number("commission", l.commission);
  w.Number("asking_price", l.asking_price);

  const auto& h = l.PrivilegedHidden();
  w.Number("dna", h.dna);
  w.Number("engine_reliability", h.engine_reliability);
  w.Number("hydraulic_reliability", h.hydraulic_reliability);
  w.Number("electrical_reliability", h.electrical_reliability);
  w.Number("reliability_ceiling", h.reliability_ceiling);
  w.Number("overall_rating", h.overall_rating);

  std::vector<std::string> revealed;
  for (auto field : l.Revealed()) revealed.emplace_back(model::ToString(field));
  w.Text("revealed", Join(revealed));

  if (l.negotiation) {
    const auto& n = *l.negotiation;
    w.Text("neg.personality", model::ToString(n.personality));
    w.Number("neg.acceptance_threshold", n.acceptance_threshold);
    w.Number("neg.tolerance", n.tolerance);
    w.Number("neg.walk_away_chance", n.walk_away_chance);
    w.Text("neg.state", n.state == model::NegotiationState::kCountered ? "countered" : "awaiting_offer");
    w.Number("neg.last_offer", n.last_offer);
    w.Number("neg.counter_price", n.counter_price);
    w.Unsigned("neg.round", n.round);
    w.Number("neg.weather_modifier", n.weather_modifier);
    w.Unsigned("neg.locked_until_hour", n.locked_until_hour);
  }
  return w.Take();
}

model::ListingRecord DecodeListing(const FlatRecord& record) {
  Reader r(record);

  model::HiddenCondition hidden;
  hidden.dna                    = r.Number("dna", hidden.dna);
  hidden.engine_reliability     = r.Number("engine_reliability", hidden.engine_reliability);
  hidden.hydraulic_reliability  = r.Number("hydraulic_reliability", hidden.hydraulic_reliability);
  hidden.electrical_reliability = r.Number("electrical_reliability", hidden.electrical_reliability);
  hidden.reliability_ceiling    = r.Number("reliability_ceiling", hidden.reliability_ceiling);
  hidden.overall_rating         = r.Number("overall_rating", hidden.overall_rating);
  if (hidden.dna < 0.0 || hidden.dna > 1.0) r.Fail("dna out of range");

  model::ListingRecord l(hidden);
  l.id            = r.Id();
  l.owner_id      = r.Required("owner_id");
  l.status        = r.Enum<model::ListingStatus>("status", model::ListingStatusFromString, model::ListingStatus::kFound);
  l.category_id   = r.Text("category_id");
  l.category_name = r.Text("category_name");
  l.source_id     = r.Text("source_id");
  l.origin        = r.Enum<model::ListingOrigin>("origin", OriginFromString, model::ListingOrigin::kSearch);
  l.quality_tier  = r.Tier<model::QualityTier>("quality_tier", model::QualityTierFromIndex, model::QualityTier::kAny);
  if (model::IsTerminal(l.status)) r.Fail("live listing with terminal status");

  l.created_at_hour = r.Unsigned("created_at_hour");
  l.ttl_hours       = r.Unsigned32("ttl_hours");
  l.on_hold         = r.Bool("on_hold");
  l.viewed          = r.Bool("viewed");

  l.condition.age_years       = r.Unsigned32("age_years");
  l.condition.damage          = r.Number("damage");
  l.condition.wear            = r.Number("wear");
  l.condition.operating_hours = r.Number("operating_hours");
  l.condition.generation =
      r.Tier<model::GenerationClass>("generation", GenerationFromIndex, model::GenerationClass::kRecent);

  l.base_price   = r.Number("base_price");
  l.price        = r.Number("price");
  l.commission   = r.Number("commission");
  l.asking_price = r.Number("asking_price");

  for (const auto& name : Split(r.Text("revealed"))) {
    auto field = model::ConditionFieldFromString(name);
    if (!field) r.Fail("unknown revealed field " + name);
    l.Reveal(*field);
  }

  if (r.Has("neg.personality")) {
    model::NegotiationRecord n;
    n.personality          = r.Enum<model::Personality>("neg.personality", model::PersonalityFromString, n.personality);
    n.acceptance_threshold = r.Number("neg.acceptance_threshold");
    n.tolerance            = r.Number("neg.tolerance");
    n.walk_away_chance     = r.Number("neg.walk_away_chance");
    n.state = r.Enum<model::NegotiationState>("neg.state", NegotiationStateFromString, model::NegotiationState::kAwaitingOffer);
    n.last_offer        = r.Number("neg.last_offer");
    n.counter_price     = r.Number("neg.counter_price");
    n.round             = r.Unsigned32("neg.round");
    n.weather_modifier  = r.Number("neg.weather_modifier");
    n.locked_until_hour = r.Unsigned("neg.locked_until_hour");
    l.negotiation       = n;
  }
  return l;
}

// ---------------------------------------------------------------------
// Search
// ---------------------------------------------------------------------

FlatRecord EncodeSearch(const model::SearchRequest& s) {
  Writer w(kSearchKind, s.id);
  w.Text("requester_id", s.requester_id);
  w.Text("category_id", s.category.id);
  w.Text("category_name", s.category.name);
  w.Number("base_price", s.category.base_price);
  w.Unsigned("quality_tier", static_cast<std::uint64_t>(s.quality_tier));
  w.Unsigned("agent_tier", static_cast<std::uint64_t>(s.agent_tier));
  w.Number("fee_paid", s.fee_paid);
  w.Unsigned("created_at_hour", s.created_at_hour);
  w.Unsigned("completes_at_hour", s.completes_at_hour);
  w.Unsigned("ttl_hours", s.ttl_hours);
  w.Unsigned("find_count", s.find_count);
  w.Text("status", model::ToString(s.status));
  w.Text("result_ids", Join(s.result_ids));
  return w.Take();
}

model::SearchRequest DecodeSearch(const FlatRecord& record) {
  Reader r(record);

  model::SearchRequest s;
  s.id                  = r.Id();
  s.requester_id        = r.Required("requester_id");
  s.category.id         = r.Required("category_id");
  s.category.name       = r.Text("category_name");
  s.category.base_price = r.Number("base_price");
  s.quality_tier        = r.Tier<model::QualityTier>("quality_tier", model::QualityTierFromIndex, model::QualityTier::kAny);
  s.agent_tier          = r.Tier<model::AgentTier>("agent_tier", model::AgentTierFromIndex, model::AgentTier::kRegional);
  s.fee_paid            = r.Number("fee_paid");
  s.created_at_hour     = r.Unsigned("created_at_hour");
  s.completes_at_hour   = r.Unsigned("completes_at_hour");
  s.ttl_hours           = r.Unsigned32("ttl_hours");
  s.find_count          = r.Unsigned32("find_count", 1);
  s.status              = r.Enum<model::SearchStatus>("status", model::SearchStatusFromString, model::SearchStatus::kActive);
  s.result_ids          = Split(r.Text("result_ids"));
  return s;
}

// ---------------------------------------------------------------------
// Sale
// ---------------------------------------------------------------------

FlatRecord EncodeSale(const model::SaleRequest& s) {
  Writer w(kSaleKind, s.id);
  w.Text("owner_id", s.owner_id);
  w.Text("listing_id", s.listing_id);

  w.Text("item.item_id", s.item.item_id);
  w.Text("item.category_id", s.item.category_id);
  w.Text("item.name", s.item.name);
  w.Number("item.vanilla_value", s.item.vanilla_value);
  w.Number("item.base_price", s.item.base_price);
  w.Unsigned("item.age_years", s.item.age_years);
  w.Number("item.damage", s.item.damage);
  w.Number("item.wear", s.item.wear);
  w.Number("item.operating_hours", s.item.operating_hours);

  w.Unsigned("agent_tier", static_cast<std::uint64_t>(s.agent_tier));
  w.Number("fee_paid", s.fee_paid);
  w.Unsigned("created_at_hour", s.created_at_hour);
  w.Text("status", model::ToString(s.status));
  w.Number("asking_price", s.asking_price);
  w.Number("expected_min", s.expected_min);
  w.Number("expected_max", s.expected_max);
  w.Unsigned("hours_until_cycle", s.hours_until_cycle);
  w.Unsigned("pending_offer_hours_remaining", s.pending_offer_hours_remaining);
  w.Unsigned("offers_received", s.offers_received);
  w.Unsigned("offers_declined", s.offers_declined);
  w.Unsigned("months_listed", s.months_listed);

  w.Unsigned("offers.count", s.offers.size());
  for (std::size_t i = 0; i < s.offers.size(); ++i) {
    WriteOffer(w, "offers." + std::to_string(i) + ".", s.offers[i]);
  }
  if (s.pending_offer) WriteOffer(w, "pending.", *s.pending_offer);
  return w.Take();
}

model::SaleRequest DecodeSale(const FlatRecord& record) {
  Reader r(record);

  model::SaleRequest s;
  s.id         = r.Id();
  s.owner_id   = r.Required("owner_id");
  s.listing_id = r.Required("listing_id");

  s.item.item_id         = r.Required("item.item_id");
  s.item.category_id     = r.Text("item.category_id");
  s.item.name            = r.Text("item.name");
  s.item.vanilla_value   = r.Number("item.vanilla_value");
  s.item.base_price      = r.Number("item.base_price");
  s.item.age_years       = r.Unsigned32("item.age_years");
  s.item.damage          = r.Number("item.damage");
  s.item.wear            = r.Number("item.wear");
  s.item.operating_hours = r.Number("item.operating_hours");

  s.agent_tier      = r.Tier<model::AgentTier>("agent_tier", model::AgentTierFromIndex, model::AgentTier::kLocal);
  s.fee_paid        = r.Number("fee_paid");
  s.created_at_hour = r.Unsigned("created_at_hour");
  s.status          = r.Enum<model::SaleStatus>("status", model::SaleStatusFromString, model::SaleStatus::kSearching);
  s.asking_price    = r.Number("asking_price");
  s.expected_min    = r.Number("expected_min");
  s.expected_max    = r.Number("expected_max");
  s.hours_until_cycle             = r.Unsigned32("hours_until_cycle");
  s.pending_offer_hours_remaining = r.Unsigned32("pending_offer_hours_remaining");
  s.offers_received               = r.Unsigned32("offers_received");
  s.offers_declined               = r.Unsigned32("offers_declined");
  s.months_listed                 = r.Unsigned32("months_listed");

  const auto count = r.Unsigned("offers.count");
  for (std::uint64_t i = 0; i < count; ++i) {
    s.offers.push_back(ReadOffer(r, "offers." + std::to_string(i) + "."));
  }
  if (r.Has("pending.amount")) s.pending_offer = ReadOffer(r, "pending.");

  if (s.status == model::SaleStatus::kOfferPending && !s.pending_offer) r.Fail("offer pending without an offer");
  return s;
}

// ---------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------

FlatRecord EncodeInspection(const model::InspectionRecord& i) {
  Writer w(kInspectionKind, i.id);
  w.Text("listing_id", i.listing_id);
  w.Text("requester_id", i.requester_id);
  w.Unsigned("tier", static_cast<std::uint64_t>(i.tier));
  w.Number("fee_paid", i.fee_paid);
  w.Unsigned("requested_at_hour", i.requested_at_hour);
  w.Unsigned("completes_at_hour", i.completes_at_hour);
  w.Text("state", model::ToString(i.state));
  return w.Take();
}

model::InspectionRecord DecodeInspection(const FlatRecord& record) {
  Reader r(record);

  model::InspectionRecord i;
  i.id                = r.Id();
  i.listing_id        = r.Required("listing_id");
  i.requester_id      = r.Required("requester_id");
  i.tier              = r.Tier<model::InspectionTier>("tier", model::InspectionTierFromIndex, model::InspectionTier::kQuick);
  i.fee_paid          = r.Number("fee_paid");
  i.requested_at_hour = r.Unsigned("requested_at_hour");
  i.completes_at_hour = r.Unsigned("completes_at_hour", i.requested_at_hour);
  i.state = r.Enum<model::InspectionState>("state", model::InspectionStateFromString, model::InspectionState::kPending);
  return i;
}

// ---------------------------------------------------------------------
// Tombstone
// ---------------------------------------------------------------------

FlatRecord EncodeTombstone(const std::string& listing_id, const market::ListingStore::Tombstone& tombstone) {
  Writer w(kTombstoneKind, listing_id);
  w.Text("status", model::ToString(tombstone.status));
  w.Unsigned("period", tombstone.period);
  return w.Take();
}

std::pair<std::string, market::ListingStore::Tombstone> DecodeTombstone(const FlatRecord& record) {
  Reader r(record);

  market::ListingStore::Tombstone tombstone;
  tombstone.status = r.Enum<model::ListingStatus>("status", model::ListingStatusFromString, model::ListingStatus::kWithdrawn);
  tombstone.period = r.Unsigned32("period");
  if (!model::IsTerminal(tombstone.status)) r.Fail("tombstone with live status");
  return {r.Id(), tombstone};
}

} // namespace usedgear::persistence
