#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/tier.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::model {

struct Category {
  std::string id;
  std::string name;
  double      base_price = 0.0;
};

enum class SearchStatus : std::uint8_t {
  kActive    = 1,
  kSucceeded = 2,
  kFailed    = 3,
  kCancelled = 4,
};

/*
  One in-flight acquisition job.

  Lives in the active set until its results have all been consumed or it
  resolves without results.
*/
struct SearchRequest {
  std::string  id;
  std::string  requester_id;
  Category     category;
  QualityTier  quality_tier = QualityTier::kAny;
  AgentTier    agent_tier   = AgentTier::kRegional;
  double       fee_paid     = 0.0;

  util::SimHour created_at_hour   = 0;
  util::SimHour completes_at_hour = 0;
  std::uint32_t ttl_hours         = 0; // remaining
  std::uint32_t find_count        = 1;

  SearchStatus             status = SearchStatus::kActive;
  std::vector<std::string> result_ids;
};

constexpr std::string_view ToString(SearchStatus status) {
  switch (status) {
    case SearchStatus::kActive:
      return "active";
    case SearchStatus::kSucceeded:
      return "succeeded";
    case SearchStatus::kFailed:
      return "failed";
    case SearchStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::optional<SearchStatus> SearchStatusFromString(std::string_view value) {
  if (value == "active") return SearchStatus::kActive;
  if (value == "succeeded") return SearchStatus::kSucceeded;
  if (value == "failed") return SearchStatus::kFailed;
  if (value == "cancelled") return SearchStatus::kCancelled;
  return std::nullopt;
}

} // namespace usedgear::model
