#include "listing.hpp"

namespace usedgear::model {

void ListingRecord::Reveal(ConditionField field) {
  revealed_.insert(field);
}

bool ListingRecord::IsRevealed(ConditionField field) const {
  return revealed_.contains(field);
}

double CurrentAsk(const ListingRecord& listing) {
  if (listing.negotiation && listing.negotiation->counter_price > 0.0) {
    return listing.negotiation->counter_price;
  }
  return listing.asking_price;
}

ListingView MakeView(const ListingRecord& listing) {
  ListingView view;
  view.id              = listing.id;
  view.category_id     = listing.category_id;
  view.category_name   = listing.category_name;
  view.owner_id        = listing.owner_id;
  view.source_id       = listing.source_id;
  view.status          = listing.status;
  view.created_at_hour = listing.created_at_hour;
  view.ttl_hours       = listing.ttl_hours;
  view.on_hold         = listing.on_hold;
  view.viewed          = listing.viewed;
  view.condition       = listing.condition;
  view.base_price      = listing.base_price;
  view.price           = listing.price;
  view.commission      = listing.commission;
  view.asking_price    = listing.asking_price;
  view.current_ask     = CurrentAsk(listing);

  const auto& hidden = listing.PrivilegedHidden();
  for (const auto field : listing.Revealed()) {
    view.revealed_fields.push_back(field);
    switch (field) {
      case ConditionField::kOverallRating:
        view.overall_rating = hidden.overall_rating;
        break;
      case ConditionField::kEngineReliability:
        view.engine_reliability = hidden.engine_reliability;
        break;
      case ConditionField::kHydraulicReliability:
        view.hydraulic_reliability = hidden.hydraulic_reliability;
        break;
      case ConditionField::kElectricalReliability:
        view.electrical_reliability = hidden.electrical_reliability;
        break;
      case ConditionField::kReliabilityCeiling:
        view.reliability_ceiling = hidden.reliability_ceiling;
        break;
      case ConditionField::kQualityHint:
        view.quality_hint = std::string(QualityHint(hidden.dna));
        break;
    }
  }
  return view;
}

std::string_view QualityHint(double dna) {
  if (dna >= 0.80) return "exceptional build, a true workhorse";
  if (dna >= 0.60) return "solid build";
  if (dna >= 0.40) return "average build";
  if (dna >= 0.20) return "questionable build";
  return "problematic build, expect recurring faults";
}

std::string_view ToString(ConditionField field) {
  switch (field) {
    case ConditionField::kOverallRating:
      return "overall_rating";
    case ConditionField::kEngineReliability:
      return "engine_reliability";
    case ConditionField::kHydraulicReliability:
      return "hydraulic_reliability";
    case ConditionField::kElectricalReliability:
      return "electrical_reliability";
    case ConditionField::kReliabilityCeiling:
      return "reliability_ceiling";
    case ConditionField::kQualityHint:
      return "quality_hint";
  }
  return "unknown";
}

std::optional<ConditionField> ConditionFieldFromString(std::string_view value) {
  for (auto field : {ConditionField::kOverallRating, ConditionField::kEngineReliability, ConditionField::kHydraulicReliability,
                     ConditionField::kElectricalReliability, ConditionField::kReliabilityCeiling, ConditionField::kQualityHint}) {
    if (ToString(field) == value) return field;
  }
  return std::nullopt;
}

} // namespace usedgear::model
