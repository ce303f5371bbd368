#include "internal/trigger/state_source.hpp"

namespace routine::trigger {

google::protobuf::Value ObservedValue(const EntityState& state, const std::string& property) {
  if (property.empty()) {
    return state.state;
  }

  auto it = state.attributes.fields().find(property);
  if (it == state.attributes.fields().end()) {
    google::protobuf::Value missing;
    missing.set_null_value(google::protobuf::NULL_VALUE);
    return missing;
  }
  return it->second;
}

} // namespace routine::trigger
