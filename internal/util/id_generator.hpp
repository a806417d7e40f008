#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace usedgear::util {

/*
  Sequential record ids ("SEARCH_00000001", "LISTING_00000002", ...).

  Counters are part of the persisted context so ids stay unique across
  save/load.
*/
class IdGenerator {
 public:
  std::string NextSearchId();
  std::string NextListingId();
  std::string NextSaleId();
  std::string NextInspectionId();

  std::uint64_t Counter() const {
    return counter_;
  }

  // Restores the counter from a snapshot. Never moves it backwards.
  void Restore(std::uint64_t counter);

  static std::string Format(std::string_view prefix, std::uint64_t value);

 private:
  std::uint64_t counter_ = 0;
};

} // namespace usedgear::util
