#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace routine::util {

/*
  UUID helpers

  Record ids and execution ids are RFC4122 v4 UUIDs in text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace routine::util
