#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace usedgear::model {

enum class QualityTier : std::uint8_t {
  kPoor      = 1,
  kAny       = 2,
  kFair      = 3,
  kGood      = 4,
  kExcellent = 5,
};

enum class AgentTier : std::uint8_t {
  kLocal    = 1,
  kRegional = 2,
  kNational = 3,
};

enum class InspectionTier : std::uint8_t {
  kQuick         = 1,
  kStandard      = 2,
  kComprehensive = 3,
};

enum class GenerationClass : std::uint8_t {
  kRecent = 0,
  kMidAge = 1,
  kOld    = 2,
};

inline constexpr std::size_t kQualityTierCount    = 5;
inline constexpr std::size_t kAgentTierCount      = 3;
inline constexpr std::size_t kInspectionTierCount = 3;
inline constexpr std::size_t kGenerationCount     = 3;

constexpr std::optional<QualityTier> QualityTierFromIndex(std::int64_t index) {
  if (index < 1 || index > static_cast<std::int64_t>(kQualityTierCount)) return std::nullopt;
  return static_cast<QualityTier>(index);
}

constexpr std::optional<AgentTier> AgentTierFromIndex(std::int64_t index) {
  if (index < 1 || index > static_cast<std::int64_t>(kAgentTierCount)) return std::nullopt;
  return static_cast<AgentTier>(index);
}

constexpr std::optional<InspectionTier> InspectionTierFromIndex(std::int64_t index) {
  if (index < 1 || index > static_cast<std::int64_t>(kInspectionTierCount)) return std::nullopt;
  return static_cast<InspectionTier>(index);
}

// Zero-based slot for table lookups.
constexpr std::size_t Slot(QualityTier tier) {
  return static_cast<std::size_t>(tier) - 1;
}

constexpr std::size_t Slot(AgentTier tier) {
  return static_cast<std::size_t>(tier) - 1;
}

constexpr std::size_t Slot(InspectionTier tier) {
  return static_cast<std::size_t>(tier) - 1;
}

constexpr std::size_t Slot(GenerationClass generation) {
  return static_cast<std::size_t>(generation);
}

constexpr std::string_view ToString(QualityTier tier) {
  switch (tier) {
    case QualityTier::kPoor:
      return "poor";
    case QualityTier::kAny:
      return "any";
    case QualityTier::kFair:
      return "fair";
    case QualityTier::kGood:
      return "good";
    case QualityTier::kExcellent:
      return "excellent";
  }
  return "unknown";
}

constexpr std::string_view ToString(AgentTier tier) {
  switch (tier) {
    case AgentTier::kLocal:
      return "local";
    case AgentTier::kRegional:
      return "regional";
    case AgentTier::kNational:
      return "national";
  }
  return "unknown";
}

constexpr std::string_view ToString(InspectionTier tier) {
  switch (tier) {
    case InspectionTier::kQuick:
      return "quick";
    case InspectionTier::kStandard:
      return "standard";
    case InspectionTier::kComprehensive:
      return "comprehensive";
  }
  return "unknown";
}

constexpr std::string_view ToString(GenerationClass generation) {
  switch (generation) {
    case GenerationClass::kRecent:
      return "recent";
    case GenerationClass::kMidAge:
      return "mid-age";
    case GenerationClass::kOld:
      return "old";
  }
  return "unknown";
}

} // namespace usedgear::model
