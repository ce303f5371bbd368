#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "internal/action/connector_registry.hpp"
#include "internal/action/notification_sink.hpp"
#include "internal/trigger/state_source.hpp"
#include "routine/manager/v1/routine.pb.h"

namespace routine::action {

/*
  Runs a routine's action list, strictly in order.

  Never throws for a single action: handler errors, missing services and
  unsupported kinds all become failed ActionResults so the remaining
  actions still run.
*/
class ActionDispatcher {
 public:
  ActionDispatcher(std::shared_ptr<const ConnectorRegistry> connectors, std::shared_ptr<NotificationSink> notifier,
                   std::shared_ptr<trigger::StateSource> state_source, std::string default_title);

  std::vector<manager::v1::ActionResult> Run(const google::protobuf::RepeatedPtrField<manager::v1::Action>& actions,
                                             const manager::v1::Routine& routine) const;

  manager::v1::ActionResult RunOne(const manager::v1::Action& action, const manager::v1::Routine& routine) const;

 private:
  manager::v1::ActionResult ConnectorCall(const manager::v1::ConnectorCallAction& action) const;
  manager::v1::ActionResult Notification(const manager::v1::NotificationAction& action, const manager::v1::Routine& routine) const;
  manager::v1::ActionResult StateChange(const manager::v1::StateChangeAction& action) const;

  std::shared_ptr<const ConnectorRegistry> connectors_;
  std::shared_ptr<NotificationSink>        notifier_;
  std::shared_ptr<trigger::StateSource>    state_source_;
  std::string                              default_title_;
};

} // namespace routine::action
