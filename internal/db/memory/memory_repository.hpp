#pragma once

#include <map>
#include <cstdint>
#include <mutex>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace usedgear::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result PutRecord(Transaction&, const model::FlatRecord&) override;
  std::optional<model::FlatRecord> GetRecord(Transaction&, const std::string& kind, const std::string& id) override;
  std::vector<model::FlatRecord> ListRecords(Transaction&, const std::string& kind) override;
  Result DeleteRecord(Transaction&, const std::string& kind, const std::string& id) override;
  Result ClearAll(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // (kind, id) ordering keeps ListRecords sorted by id.
    std::map<std::pair<std::string, std::string>, model::FlatRecord> records;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
