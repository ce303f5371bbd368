#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/time.hpp"

namespace routine::store {

/*
  RecordStore over a db::Repository backend.

  Each call runs in its own transaction; metadata is kept as JSON text.
*/
class RepositoryRecordStore final : public RecordStore {
 public:
  RepositoryRecordStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock);

  std::vector<StoredMemory> GetRoutines(bool enabled_only) override;
  std::vector<StoredMemory> GetMemories(const std::string& kind) override;
  std::optional<StoredMemory> GetMemoryById(const std::string& id) override;
  std::string AddMemory(const std::string& text, const std::string& author, const std::string& kind, const std::string& persona,
                        int32_t importance, const google::protobuf::Struct& metadata) override;
  void UpdateMemory(const std::string& id, const StoredMemory& record) override;
  bool DeleteMemory(const std::string& id) override;

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const util::ClockSource> clock_;
};

} // namespace routine::store
