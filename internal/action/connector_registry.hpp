#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "routine/manager/v1/routine.pb.h"

namespace routine::action {

// (method, parameters) -> connector envelope
using ConnectorHandler = std::function<manager::v1::ActionResult(const std::string& method, const google::protobuf::Struct& parameters)>;

/*
  Explicit service id -> handler map.

  Populated once at startup, read-only afterwards. Registering the same
  service twice throws util::AlreadyExists.
*/
class ConnectorRegistry {
 public:
  void Register(const std::string& service, ConnectorHandler handler);

  // nullptr when no handler is registered for service.
  const ConnectorHandler* Find(const std::string& service) const;

  std::vector<std::string> Services() const;

 private:
  std::map<std::string, ConnectorHandler> handlers_;
};

} // namespace routine::action
