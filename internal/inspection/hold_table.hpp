#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/sim_clock.hpp"

namespace usedgear::inspection {

/*
  A hold keeps a listing out of the expiry countdown while an inspection
  runs. It stays active through releases_at_hour inclusive.
*/
struct Hold {
  std::string   hold_id; // inspection id
  std::string   listing_id;
  util::SimHour placed_at_hour   = 0;
  util::SimHour releases_at_hour = 0;
};

class HoldTable {
 public:
  // Replaces any hold with the same id and drops stale holds on the listing.
  Hold Insert(const Hold& hold);

  void Remove(const std::string& hold_id);

  bool HasActive(const std::string& listing_id, util::SimHour now);

  std::optional<Hold> ActiveFor(const std::string& listing_id, util::SimHour now);

  void RemoveAll(const std::string& listing_id);

  std::vector<Hold> All() const;

  std::size_t Size() const {
    return holds_.size();
  }

 private:
  std::unordered_map<std::string, Hold>             holds_;
  std::unordered_multimap<std::string, std::string> by_listing_;

  static bool IsExpired(const Hold& hold, util::SimHour now);

  // Drops expired holds indexed under listing_id; returns the first live one.
  std::optional<Hold> PruneListing(const std::string& listing_id, util::SimHour now);
};

} // namespace usedgear::inspection
