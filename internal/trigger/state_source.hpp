#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "routine/manager/v1/routine.pb.h"

namespace routine::trigger {

struct EntityState {
  google::protobuf::Value  state;
  google::protobuf::Struct attributes;
};

/*
  State-query source (Home Assistant).

  Both calls throw util::ConnectorError when the backend is unreachable
  or answers with an error.
*/
class StateSource {
 public:
  virtual ~StateSource() = default;

  virtual EntityState GetState(const std::string& entity) = 0;

  // Invokes <domain>.<operation> on entity with extra service data.
  virtual manager::v1::ActionResult CallService(const std::string& domain, const std::string& operation, const std::string& entity,
                                                const google::protobuf::Struct& data) = 0;
};

// attributes[property] when property is set (null if absent), else the state.
google::protobuf::Value ObservedValue(const EntityState& state, const std::string& property);

} // namespace routine::trigger
