#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/db/model/flat_record.hpp"
#include "internal/market/listing_store.hpp"
#include "internal/model/inspection.hpp"
#include "internal/model/listing.hpp"
#include "internal/model/sale_request.hpp"
#include "internal/model/search_request.hpp"
#include "internal/util/sim_clock.hpp"

namespace usedgear::persistence {

/*
  Engine records <-> flat attribute sets.

  Decoding tolerates missing optional attributes (they take their
  defaults) and throws util::CorruptRecordError when a required attribute
  is missing or any attribute does not parse.
*/

inline constexpr const char* kMetaKind       = "meta";
inline constexpr const char* kListingKind    = "listing";
inline constexpr const char* kSearchKind     = "search";
inline constexpr const char* kSaleKind       = "sale";
inline constexpr const char* kInspectionKind = "inspection";
inline constexpr const char* kTombstoneKind  = "tombstone";

inline constexpr const char* kMetaId = "engine";

struct EngineMeta {
  util::SimHour hour       = 0;
  std::uint32_t period     = 0;
  std::uint64_t id_counter = 0;
  std::uint64_t seed       = 0;
  std::string   rng_state;
};

db::model::FlatRecord EncodeMeta(const EngineMeta& meta);
EngineMeta            DecodeMeta(const db::model::FlatRecord& record);

db::model::FlatRecord EncodeListing(const model::ListingRecord& listing);
model::ListingRecord  DecodeListing(const db::model::FlatRecord& record);

db::model::FlatRecord EncodeSearch(const model::SearchRequest& search);
model::SearchRequest  DecodeSearch(const db::model::FlatRecord& record);

db::model::FlatRecord EncodeSale(const model::SaleRequest& sale);
model::SaleRequest    DecodeSale(const db::model::FlatRecord& record);

db::model::FlatRecord   EncodeInspection(const model::InspectionRecord& inspection);
model::InspectionRecord DecodeInspection(const db::model::FlatRecord& record);

db::model::FlatRecord EncodeTombstone(const std::string& listing_id, const market::ListingStore::Tombstone& tombstone);
std::pair<std::string, market::ListingStore::Tombstone> DecodeTombstone(const db::model::FlatRecord& record);

} // namespace usedgear::persistence
