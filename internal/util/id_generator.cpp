#include "id_generator.hpp"

#include <cstdio>

namespace usedgear::util {

std::string IdGenerator::Format(std::string_view prefix, std::uint64_t value) {
  char digits[24];
  std::snprintf(digits, sizeof(digits), "%08llu", static_cast<unsigned long long>(value));
  std::string id(prefix);
  id += '_';
  id += digits;
  return id;
}

std::string IdGenerator::NextSearchId() {
  return Format("SEARCH", ++counter_);
}

std::string IdGenerator::NextListingId() {
  return Format("LISTING", ++counter_);
}

std::string IdGenerator::NextSaleId() {
  return Format("SALE", ++counter_);
}

std::string IdGenerator::NextInspectionId() {
  return Format("INSPECTION", ++counter_);
}

void IdGenerator::Restore(std::uint64_t counter) {
  if (counter > counter_) counter_ = counter;
}

} // namespace usedgear::util
