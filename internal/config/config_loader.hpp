#pragma once

#include <string>

#include "config/config.pb.h"

namespace routine::config {

/*
  Loads RuntimeConfig from YAML.

  The document is converted to JSON and parsed into the protobuf with
  unknown fields rejected. ${NAME} inside a scalar expands to the
  environment value. Quoted scalars are never coerced to numbers or bools.
  Out-of-range values throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static routine::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document.
  static routine::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace routine::config
