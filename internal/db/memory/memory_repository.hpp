#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace routine::db::memory {

class MemoryTransaction;

// In-process record table. Used for tests and the `memory` backend.
class MemoryRepository final : public db::Repository {
 public:
  using Records = std::unordered_map<std::string, model::MemoryRecord>;

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertRecord(Transaction& tx, const model::MemoryRecord& record) override;
  std::optional<model::MemoryRecord> GetRecord(Transaction& tx, const std::string& id) override;
  std::vector<model::MemoryRecord>   ListRecords(Transaction& tx, const std::string& kind) override;
  Result                             UpdateRecord(Transaction& tx, const model::MemoryRecord& record) override;
  Result                             DeleteRecord(Transaction& tx, const std::string& id) override;

 private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  Records    records_;
};

} // namespace routine::db::memory
