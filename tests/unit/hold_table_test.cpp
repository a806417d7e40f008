#include "internal/inspection/hold_table.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using usedgear::inspection::Hold;
using usedgear::inspection::HoldTable;

Hold MakeHold(const std::string& hold_id, const std::string& listing_id, std::uint64_t placed, std::uint64_t releases) {
  Hold hold;
  hold.hold_id          = hold_id;
  hold.listing_id       = listing_id;
  hold.placed_at_hour   = placed;
  hold.releases_at_hour = releases;
  return hold;
}

void TestHoldActiveThroughReleaseHour() {
  HoldTable table;
  table.Insert(MakeHold("INSPECTION_1", "LISTING_1", 1000, 1002));

  assert(table.HasActive("LISTING_1", 1000));
  assert(table.HasActive("LISTING_1", 1001));
  assert(table.HasActive("LISTING_1", 1002));
  assert(!table.HasActive("LISTING_1", 1003));
}

void TestExpiredHoldIsPruned() {
  HoldTable table;
  table.Insert(MakeHold("INSPECTION_1", "LISTING_1", 10, 12));

  assert(!table.HasActive("LISTING_1", 20));
  assert(table.Size() == 0);
}

void TestMixedExpiredAndActiveHolds() {
  HoldTable table;
  table.Insert(MakeHold("INSPECTION_old", "LISTING_1", 0, 5));
  table.Insert(MakeHold("INSPECTION_new", "LISTING_1", 10, 20));

  auto active = table.ActiveFor("LISTING_1", 15);
  assert(active.has_value());
  assert(active->hold_id == "INSPECTION_new");

  table.Remove("INSPECTION_new");
  assert(!table.HasActive("LISTING_1", 15));
}

void TestReinsertMovesHoldBetweenListings() {
  HoldTable table;
  table.Insert(MakeHold("INSPECTION_shared", "LISTING_a", 0, 30));
  table.Insert(MakeHold("INSPECTION_shared", "LISTING_b", 0, 30));

  assert(!table.HasActive("LISTING_a", 1));
  assert(table.HasActive("LISTING_b", 1));

  table.RemoveAll("LISTING_b");
  assert(!table.HasActive("LISTING_b", 1));
  assert(table.Size() == 0);
}

void TestAllIsSortedById() {
  HoldTable table;
  table.Insert(MakeHold("INSPECTION_3", "LISTING_3", 0, 10));
  table.Insert(MakeHold("INSPECTION_1", "LISTING_1", 0, 10));
  table.Insert(MakeHold("INSPECTION_2", "LISTING_2", 0, 10));

  const auto all = table.All();
  assert(all.size() == 3);
  assert(all[0].hold_id == "INSPECTION_1");
  assert(all[2].hold_id == "INSPECTION_3");
}

} // namespace

int main() {
  TestHoldActiveThroughReleaseHour();
  TestExpiredHoldIsPruned();
  TestMixedExpiredAndActiveHolds();
  TestReinsertMovesHoldBetweenListings();
  TestAllIsSortedById();

  std::cout << "usedgear_unit_hold_table: pass\n";
  return 0;
}
