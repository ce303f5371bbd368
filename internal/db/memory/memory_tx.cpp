#include "memory_tx.hpp"

#include <stdexcept>

namespace routine::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.records_;
}

void MemoryTransaction::Commit() {
  EnsureOpen();

  std::scoped_lock lock(repo_.mutex_);
  for (auto& [id, record] : writes_) {
    if (record) {
      repo_.records_[id] = std::move(*record);
    } else {
      repo_.records_.erase(id);
    }
  }
  writes_.clear();
  finished_ = true;
}

void MemoryTransaction::Rollback() {
  EnsureOpen();
  writes_.clear();
  finished_ = true;
}

const model::MemoryRecord* MemoryTransaction::Find(const std::string& id) const {
  if (auto it = writes_.find(id); it != writes_.end()) {
    return it->second ? &*it->second : nullptr;
  }
  auto it = snapshot_.find(id);
  return it == snapshot_.end() ? nullptr : &it->second;
}

std::vector<model::MemoryRecord> MemoryTransaction::Collect(const std::string& kind) const {
  std::vector<model::MemoryRecord> out;
  for (const auto& [id, record] : snapshot_) {
    if (!writes_.contains(id) && record.kind == kind) out.push_back(record);
  }
  for (const auto& [id, record] : writes_) {
    if (record && record->kind == kind) out.push_back(*record);
  }
  return out;
}

void MemoryTransaction::Put(const model::MemoryRecord& record) {
  EnsureOpen();
  writes_[record.id] = record;
}

void MemoryTransaction::Erase(const std::string& id) {
  EnsureOpen();
  writes_[id] = std::nullopt;
}

void MemoryTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::logic_error("memory transaction already finished");
  }
}

} // namespace routine::db::memory
