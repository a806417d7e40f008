#pragma once

#include <map>
#include <string>

namespace usedgear::db::model {

/*
  One persisted engine record as a flat attribute set.

  kind names the record type ("listing", "search", ...); attributes hold
  every field as text so new fields can be added without a schema change.
*/
struct FlatRecord {
  std::string                        kind;
  std::string                        id;
  std::map<std::string, std::string> attributes;
};

} // namespace usedgear::db::model
