#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace routine::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::InsertRecord(Transaction& t, const model::MemoryRecord& record) {
  auto& tx = TX(t);
  if (tx.Find(record.id)) return Result::Err(ErrorCode::AlreadyExists, "record " + record.id + " already exists");
  tx.Put(record);
  return Result::Ok();
}

std::optional<model::MemoryRecord> MemoryRepository::GetRecord(Transaction& t, const std::string& id) {
  const auto* record = TX(t).Find(id);
  if (!record) return std::nullopt;
  return *record;
}

std::vector<model::MemoryRecord> MemoryRepository::ListRecords(Transaction& t, const std::string& kind) {
  auto records = TX(t).Collect(kind);
  std::sort(records.begin(), records.end(), [](const model::MemoryRecord& a, const model::MemoryRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateRecord(Transaction& t, const model::MemoryRecord& record) {
  auto& tx = TX(t);
  if (!tx.Find(record.id)) return Result::Err(ErrorCode::NotFound, "record " + record.id + " not found");
  tx.Put(record);
  return Result::Ok();
}

Result MemoryRepository::DeleteRecord(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (!tx.Find(id)) return Result::Err(ErrorCode::NotFound, "record " + id + " not found");
  tx.Erase(id);
  return Result::Ok();
}

} // namespace routine::db::memory
