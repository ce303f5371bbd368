#pragma once

#include <cstdint>
#include <string>

namespace routine::db::model {

/*
  Generic record-store row.

  Routines are records of kind "routine"; everything routine-specific
  lives in metadata_json (a JSON object).
*/

struct MemoryRecord {
  std::string id;
  std::string kind;
  std::string text;
  std::string author;
  std::string persona;
  int32_t     importance = 0;

  std::string metadata_json = "{}";

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace routine::db::model
