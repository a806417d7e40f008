#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace usedgear::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::PutRecord(Transaction& t, const model::FlatRecord& r) {
  if (auto res = RequireWritable(t); !res) return res;
  if (r.kind.empty() || r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "record kind and id are required");
  TX(t).Mutable().records[{r.kind, r.id}] = r;
  return Result::Ok();
}

std::optional<model::FlatRecord> MemoryRepository::GetRecord(Transaction& t, const std::string& kind, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find({kind, id});
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FlatRecord> MemoryRepository::ListRecords(Transaction& t, const std::string& kind) {
  const auto&                    s = TX(t).View();
  std::vector<model::FlatRecord> out;
  for (auto it = s.records.lower_bound({kind, std::string{}}); it != s.records.end() && it->first.first == kind; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteRecord(Transaction& t, const std::string& kind, const std::string& id) {
  if (auto res = RequireWritable(t); !res) return res;
  auto& s = TX(t).Mutable();
  if (s.records.erase({kind, id}) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result MemoryRepository::ClearAll(Transaction& t) {
  if (auto res = RequireWritable(t); !res) return res;
  TX(t).Mutable().records.clear();
  return Result::Ok();
}

} // namespace usedgear::db::memory
