#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace routine::db::memory {

/*
  Snapshot taken at Begin() plus a write overlay.

  Commit applies only the overlay, so concurrent transactions touching
  different records never clobber each other; on the same record the
  last commit wins.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;

  const model::MemoryRecord* Find(const std::string& id) const;
  std::vector<model::MemoryRecord> Collect(const std::string& kind) const;

  void Put(const model::MemoryRecord& record);
  void Erase(const std::string& id);

 private:
  void EnsureOpen() const;

  MemoryRepository&                                                   repo_;
  MemoryRepository::Records                                           snapshot_;
  // nullopt marks a deletion
  std::unordered_map<std::string, std::optional<model::MemoryRecord>> writes_;
  bool                                                                finished_ = false;
};

} // namespace routine::db::memory
