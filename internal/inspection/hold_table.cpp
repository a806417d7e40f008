#include "hold_table.hpp"

#include <algorithm>

namespace usedgear::inspection {

bool HoldTable::IsExpired(const Hold& hold, util::SimHour now) {
  return hold.releases_at_hour < now;
}

std::optional<Hold> HoldTable::PruneListing(const std::string& listing_id, util::SimHour now) {
  std::optional<Hold> live;

  auto range = by_listing_.equal_range(listing_id);
  for (auto it = range.first; it != range.second;) {
    auto hold_it = holds_.find(it->second);
    if (hold_it == holds_.end() || IsExpired(hold_it->second, now) || hold_it->second.listing_id != listing_id) {
      if (hold_it != holds_.end() && hold_it->second.listing_id == listing_id) holds_.erase(hold_it);
      it = by_listing_.erase(it);
      continue;
    }

    if (!live) live = hold_it->second;
    ++it;
  }

  return live;
}

Hold HoldTable::Insert(const Hold& hold) {
  if (auto existing = holds_.find(hold.hold_id); existing != holds_.end()) {
    auto old_range = by_listing_.equal_range(existing->second.listing_id);
    for (auto it = old_range.first; it != old_range.second; ++it) {
      if (it->second == hold.hold_id) {
        by_listing_.erase(it);
        break;
      }
    }
    holds_.erase(existing);
  }

  PruneListing(hold.listing_id, hold.placed_at_hour);

  holds_[hold.hold_id] = hold;
  by_listing_.emplace(hold.listing_id, hold.hold_id);
  return hold;
}

void HoldTable::Remove(const std::string& hold_id) {
  auto it = holds_.find(hold_id);
  if (it == holds_.end()) return;

  auto range = by_listing_.equal_range(it->second.listing_id);
  for (auto i = range.first; i != range.second; ++i) {
    if (i->second == hold_id) {
      by_listing_.erase(i);
      break;
    }
  }

  holds_.erase(it);
}

bool HoldTable::HasActive(const std::string& listing_id, util::SimHour now) {
  return PruneListing(listing_id, now).has_value();
}

std::optional<Hold> HoldTable::ActiveFor(const std::string& listing_id, util::SimHour now) {
  return PruneListing(listing_id, now);
}

void HoldTable::RemoveAll(const std::string& listing_id) {
  auto range = by_listing_.equal_range(listing_id);
  for (auto it = range.first; it != range.second;) {
    holds_.erase(it->second);
    it = by_listing_.erase(it);
  }
}

std::vector<Hold> HoldTable::All() const {
  std::vector<Hold> out;
  out.reserve(holds_.size());
  for (const auto& [id, hold] : holds_) {
    out.push_back(hold);
  }
  std::sort(out.begin(), out.end(), [](const Hold& a, const Hold& b) { return a.hold_id < b.hold_id; });
  return out;
}

} // namespace usedgear::inspection
