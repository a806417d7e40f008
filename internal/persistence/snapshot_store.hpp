#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/market/market_context.hpp"

namespace usedgear::persistence {

struct LoadReport {
  std::size_t loaded  = 0;
  std::size_t skipped = 0; // corrupt or orphaned records
};

/*
  Whole-market snapshots on top of a db::Repository.

  Save replaces the stored snapshot in a single transaction. Load rebuilds
  a context from it: corrupt records are logged and skipped, and holds are
  re-derived from pending inspections rather than stored.
*/
class SnapshotStore {
 public:
  explicit SnapshotStore(std::shared_ptr<db::Repository> repository);

  // Returns the number of records written.
  std::size_t Save(const market::MarketContext& ctx);

  // Replaces everything in `ctx`. Returns false (and leaves `ctx`
  // untouched) when no snapshot has been saved yet.
  bool Load(market::MarketContext& ctx, LoadReport* report = nullptr);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace usedgear::persistence
