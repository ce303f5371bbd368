#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace routine::store {

inline constexpr std::string_view kRoutineKind       = "routine";
inline constexpr std::string_view kRoutineEnabledKey = "routineEnabled";
inline constexpr std::string_view kTaskKind          = "task";

struct StoredMemory {
  std::string id;
  std::string kind;
  std::string text;
  std::string author;
  std::string persona;
  int32_t     importance = 0;

  google::protobuf::Struct metadata;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

/*
  Persistent record store consumed by the routine engine.

  Routine definitions are records of kind "routine" whose routine data
  lives entirely in the metadata bag; text is a free-form summary.

  Errors:
    UpdateMemory on an unknown id -> util::NotFound
    backend failures               -> std::runtime_error
*/
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  // Routine records, oldest first. enabled_only keeps records whose
  // routineEnabled metadata is true.
  virtual std::vector<StoredMemory> GetRoutines(bool enabled_only) = 0;

  // Every record of the kind, oldest first.
  virtual std::vector<StoredMemory> GetMemories(const std::string& kind) = 0;

  virtual std::optional<StoredMemory> GetMemoryById(const std::string& id) = 0;

  // Returns the assigned id.
  virtual std::string AddMemory(const std::string& text, const std::string& author, const std::string& kind, const std::string& persona,
                                int32_t importance, const google::protobuf::Struct& metadata) = 0;

  virtual void UpdateMemory(const std::string& id, const StoredMemory& record) = 0;

  // false when no record had this id.
  virtual bool DeleteMemory(const std::string& id) = 0;
};

} // namespace routine::store
