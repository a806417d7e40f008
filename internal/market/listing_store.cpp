#include "listing_store.hpp"

#include <stdexcept>

namespace usedgear::market {

model::ListingRecord& ListingStore::Insert(model::ListingRecord listing) {
  if (listing.id.empty()) {
    throw std::invalid_argument("listing id is empty");
  }
  if (live_.count(listing.id) != 0 || tombstones_.count(listing.id) != 0) {
    throw std::invalid_argument("duplicate listing id: " + listing.id);
  }

  auto key = listing.id;
  auto it  = live_.emplace(std::move(key), std::move(listing)).first;
  return it->second;
}

model::ListingRecord* ListingStore::Find(const std::string& id) {
  auto it = live_.find(id);
  return it == live_.end() ? nullptr : &it->second;
}

const model::ListingRecord* ListingStore::Find(const std::string& id) const {
  auto it = live_.find(id);
  return it == live_.end() ? nullptr : &it->second;
}

bool ListingStore::Resolve(const std::string& id, model::ListingStatus terminal, std::uint32_t period) {
  if (!model::IsTerminal(terminal)) {
    throw std::invalid_argument("resolve needs a terminal status, got " + std::string(model::ToString(terminal)));
  }

  auto it = live_.find(id);
  if (it == live_.end()) return false;

  live_.erase(it);
  tombstones_[id] = Tombstone{terminal, period};
  return true;
}

std::optional<ListingStore::Tombstone> ListingStore::TombstoneFor(const std::string& id) const {
  auto it = tombstones_.find(id);
  if (it == tombstones_.end()) return std::nullopt;
  return it->second;
}

void ListingStore::RestoreTombstone(const std::string& id, Tombstone tombstone) {
  live_.erase(id);
  tombstones_[id] = tombstone;
}

std::size_t ListingStore::PruneTombstones(std::uint32_t current_period, std::uint32_t retention) {
  std::size_t pruned = 0;
  for (auto it = tombstones_.begin(); it != tombstones_.end();) {
    if (current_period >= it->second.period && current_period - it->second.period > retention) {
      it = tombstones_.erase(it);
      ++pruned;
      continue;
    }
    ++it;
  }
  return pruned;
}

std::vector<const model::ListingRecord*> ListingStore::ByOwner(const std::string& owner_id) const {
  std::vector<const model::ListingRecord*> out;
  for (const auto& [id, listing] : live_) {
    if (listing.owner_id == owner_id) out.push_back(&listing);
  }
  return out;
}

void ListingStore::Clear() {
  live_.clear();
  tombstones_.clear();
}

} // namespace usedgear::market
