#include "internal/store/repository_record_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace routine::store {
namespace {

void ThrowIfError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(context + ": " + result.message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(context + ": " + result.message);
    default:
      throw std::runtime_error(context + " failed (" + std::string(db::ErrorCodeName(result.code)) + "): " + result.message);
  }
}

StoredMemory FromRecord(const db::model::MemoryRecord& record) {
  StoredMemory memory;
  memory.id         = record.id;
  memory.kind       = record.kind;
  memory.text       = record.text;
  memory.author     = record.author;
  memory.persona    = record.persona;
  memory.importance = record.importance;
  util::FromJson(record.metadata_json.empty() ? "{}" : record.metadata_json, &memory.metadata);
  memory.created_at_ms = record.created_at_ms;
  memory.updated_at_ms = record.updated_at_ms;
  return memory;
}

bool IsEnabled(const StoredMemory& memory) {
  const auto& fields = memory.metadata.fields();
  auto        it     = fields.find(std::string(kRoutineEnabledKey));
  return it != fields.end() && it->second.kind_case() == google::protobuf::Value::kBoolValue && it->second.bool_value();
}

} // namespace

RepositoryRecordStore::RepositoryRecordStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("RepositoryRecordStore: repository is null");
  }
  if (!clock_) {
    throw std::invalid_argument("RepositoryRecordStore: clock is null");
  }
}

std::vector<StoredMemory> RepositoryRecordStore::GetRoutines(bool enabled_only) {
  auto routines = GetMemories(std::string(kRoutineKind));
  if (enabled_only) {
    routines.erase(std::remove_if(routines.begin(), routines.end(), [](const StoredMemory& memory) { return !IsEnabled(memory); }),
                   routines.end());
  }
  return routines;
}

std::vector<StoredMemory> RepositoryRecordStore::GetMemories(const std::string& kind) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListRecords(*tx, kind);
  tx->Commit();

  std::vector<StoredMemory> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

std::optional<StoredMemory> RepositoryRecordStore::GetMemoryById(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRecord(*tx, id);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return FromRecord(*record);
}

std::string RepositoryRecordStore::AddMemory(const std::string& text, const std::string& author, const std::string& kind,
                                             const std::string& persona, int32_t importance, const google::protobuf::Struct& metadata) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::model::MemoryRecord record;
  record.id            = util::NewId();
  record.kind          = kind;
  record.text          = text;
  record.author        = author;
  record.persona       = persona;
  record.importance    = importance;
  record.metadata_json = util::ToJson(metadata);
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;

  auto tx = repository_->Begin();
  ThrowIfError(repository_->InsertRecord(*tx, record), "insert memory");
  tx->Commit();

  return record.id;
}

void RepositoryRecordStore::UpdateMemory(const std::string& id, const StoredMemory& memory) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetRecord(*tx, id);
  if (!current) {
    throw util::NotFound("memory " + id + " not found");
  }

  db::model::MemoryRecord record = *current;
  record.kind          = memory.kind;
  record.text          = memory.text;
  record.author        = memory.author;
  record.persona       = memory.persona;
  record.importance    = memory.importance;
  record.metadata_json = util::ToJson(memory.metadata);
  record.updated_at_ms = util::ToUnixMillis(clock_->Now());

  ThrowIfError(repository_->UpdateRecord(*tx, record), "update memory " + id);
  tx->Commit();
}

bool RepositoryRecordStore::DeleteMemory(const std::string& id) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteRecord(*tx, id);
  if (result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    return false;
  }
  ThrowIfError(result, "delete memory " + id);
  tx->Commit();
  return true;
}

} // namespace routine::store
