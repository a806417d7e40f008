#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/flat_record.hpp"

namespace usedgear::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A record is written whole: its attribute set replaces the stored one

  Records are keyed by (kind, id).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual Result PutRecord(Transaction&, const model::FlatRecord&) = 0;

  virtual std::optional<model::FlatRecord> GetRecord(Transaction&, const std::string& kind, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::FlatRecord> ListRecords(Transaction&, const std::string& kind) = 0;

  virtual Result DeleteRecord(Transaction&, const std::string& kind, const std::string& id) = 0;

  virtual Result ClearAll(Transaction&) = 0;
};

} // namespace usedgear::db
