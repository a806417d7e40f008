#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/listing.hpp"

namespace usedgear::market {

/*
  Live listings plus tombstones for the ones that left the market.

  A resolved listing is erased from the live set and never comes back;
  the tombstone only remembers how it ended so a late action can be told
  "already handled" instead of "unknown".
*/
class ListingStore {
 public:
  struct Tombstone {
    model::ListingStatus status = model::ListingStatus::kWithdrawn;
    std::uint32_t        period = 0;
  };

  // Throws std::invalid_argument on an empty or duplicate id.
  model::ListingRecord& Insert(model::ListingRecord listing);

  model::ListingRecord*       Find(const std::string& id);
  const model::ListingRecord* Find(const std::string& id) const;

  // Erases the live record and leaves a tombstone. Returns false when the
  // id is not live.
  bool Resolve(const std::string& id, model::ListingStatus terminal, std::uint32_t period);

  std::optional<Tombstone> TombstoneFor(const std::string& id) const;
  void                     RestoreTombstone(const std::string& id, Tombstone tombstone);

  // Drops tombstones older than `retention` periods. Returns how many went.
  std::size_t PruneTombstones(std::uint32_t current_period, std::uint32_t retention);

  std::vector<const model::ListingRecord*> ByOwner(const std::string& owner_id) const;

  std::map<std::string, model::ListingRecord>& Live() {
    return live_;
  }
  const std::map<std::string, model::ListingRecord>& Live() const {
    return live_;
  }
  const std::map<std::string, Tombstone>& Tombstones() const {
    return tombstones_;
  }

  void Clear();

 private:
  std::map<std::string, model::ListingRecord> live_;
  std::map<std::string, Tombstone>            tombstones_;
};

} // namespace usedgear::market
