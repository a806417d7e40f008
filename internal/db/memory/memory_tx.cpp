#include "memory_tx.hpp"

#include <stdexcept>

namespace usedgear::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }
  if (mode_ == TxMode::kRead) {
    working_   = {};
    committed_ = true;
    return;
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: another snapshot was saved since this one began");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_     = {};
  rolled_back_ = true;
}

} // namespace usedgear::db::memory
