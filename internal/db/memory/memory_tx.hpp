#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace usedgear::db::memory {

/*
  A private copy of the committed records. A write transaction publishes
  its copy on Commit() unless another writer committed first; a read
  transaction never publishes.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  TxMode                  mode_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace usedgear::db::memory
