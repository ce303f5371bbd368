#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/memory_record.hpp"

namespace routine::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Concurrent writers to the same record: last commit wins

  The DB is the source of truth for routine definitions and
  execution bookkeeping.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual Result InsertRecord(Transaction&, const model::MemoryRecord&) = 0;

  virtual std::optional<model::MemoryRecord> GetRecord(Transaction&, const std::string& id) = 0;

  // Ordered by creation time, then id.
  virtual std::vector<model::MemoryRecord> ListRecords(Transaction&, const std::string& kind) = 0;

  virtual Result UpdateRecord(Transaction&, const model::MemoryRecord&) = 0;

  virtual Result DeleteRecord(Transaction&, const std::string& id) = 0;
};

} // namespace routine::db
