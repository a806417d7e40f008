#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/listing_status.hpp"
#include "internal/model/negotiation.hpp"
#include "internal/model/tier.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::model {

struct VisibleCondition {
  std::uint32_t   age_years       = 0;
  double          damage          = 0.0;
  double          wear            = 0.0;
  double          operating_hours = 0.0;
  GenerationClass generation      = GenerationClass::kRecent;
};

/*
  Condition data the player does not see until an inspection reveals it.
*/
struct HiddenCondition {
  double dna                    = 0.5;
  double engine_reliability     = 1.0;
  double hydraulic_reliability  = 1.0;
  double electrical_reliability = 1.0;
  double reliability_ceiling    = 1.0;
  double overall_rating         = 100.0;
};

enum class ConditionField : std::uint8_t {
  kOverallRating         = 1,
  kEngineReliability     = 2,
  kHydraulicReliability  = 3,
  kElectricalReliability = 4,
  kReliabilityCeiling    = 5,
  kQualityHint           = 6,
};

enum class ListingOrigin : std::uint8_t {
  kSearch = 1,
  kSale   = 2,
};

/*
  One unit of used goods.

  Hidden condition is private: callers see it only through the revealed
  field set (MakeView) unless they explicitly ask for the privileged
  engine accessor.
*/
class ListingRecord {
 public:
  ListingRecord() = default;
  explicit ListingRecord(HiddenCondition hidden) : hidden_(hidden) {
  }

  std::string   id;
  std::string   category_id;
  std::string   category_name;
  std::string   owner_id;
  std::string   source_id; // search or sale that produced the listing
  ListingOrigin origin = ListingOrigin::kSearch;
  QualityTier   quality_tier = QualityTier::kAny;

  ListingStatus status          = ListingStatus::kFound;
  util::SimHour created_at_hour = 0;
  std::uint32_t ttl_hours       = 0;
  bool          on_hold         = false;
  bool          viewed          = false;

  VisibleCondition condition;

  double base_price   = 0.0;
  double price        = 0.0;
  double commission   = 0.0;
  double asking_price = 0.0;

  std::optional<NegotiationRecord> negotiation;

  void Reveal(ConditionField field);
  bool IsRevealed(ConditionField field) const;
  const std::set<ConditionField>& Revealed() const {
    return revealed_;
  }

  // Engine-internal access to the hidden condition (personality, inspection
  // reports, persistence). Presentation code goes through MakeView.
  const HiddenCondition& PrivilegedHidden() const {
    return hidden_;
  }

 private:
  HiddenCondition          hidden_;
  std::set<ConditionField> revealed_;
};

/*
  Read-only projection returned to callers. Hidden fields are populated
  only when revealed.
*/
struct ListingView {
  std::string   id;
  std::string   category_id;
  std::string   category_name;
  std::string   owner_id;
  std::string   source_id;
  ListingStatus status          = ListingStatus::kFound;
  util::SimHour created_at_hour = 0;
  std::uint32_t ttl_hours       = 0;
  bool          on_hold         = false;
  bool          viewed          = false;

  VisibleCondition condition;

  double base_price   = 0.0;
  double price        = 0.0;
  double commission   = 0.0;
  double asking_price = 0.0;
  double current_ask  = 0.0;

  std::optional<double>      overall_rating;
  std::optional<double>      engine_reliability;
  std::optional<double>      hydraulic_reliability;
  std::optional<double>      electrical_reliability;
  std::optional<double>      reliability_ceiling;
  std::optional<std::string> quality_hint;
  std::vector<ConditionField> revealed_fields;
};

ListingView MakeView(const ListingRecord& listing);

// Seller's current price: the latest counter, otherwise the asking price.
double CurrentAsk(const ListingRecord& listing);

std::string_view QualityHint(double dna);

std::string_view ToString(ConditionField field);
std::optional<ConditionField> ConditionFieldFromString(std::string_view value);

} // namespace usedgear::model
