#include "internal/action/action_dispatcher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace routine::action {
namespace {

namespace v1 = routine::manager::v1;

v1::ActionResult Failed(const std::string& error) {
  v1::ActionResult result;
  result.set_success(false);
  result.set_error(error);
  return result;
}

const char* KindName(const v1::Action& action) {
  switch (action.kind_case()) {
    case v1::Action::kConnectorCall:
      return "connector_call";
    case v1::Action::kNotification:
      return "notification";
    case v1::Action::kStateChange:
      return "state_change";
    case v1::Action::kCustom:
      return "custom";
    case v1::Action::KIND_NOT_SET:
      break;
  }
  return "unset";
}

} // namespace

ActionDispatcher::ActionDispatcher(std::shared_ptr<const ConnectorRegistry> connectors, std::shared_ptr<NotificationSink> notifier,
                                   std::shared_ptr<trigger::StateSource> state_source, std::string default_title)
    : connectors_(std::move(connectors)), notifier_(std::move(notifier)), state_source_(std::move(state_source)), default_title_(std::move(default_title)) {
  if (!connectors_) {
    throw std::invalid_argument("ActionDispatcher: connector registry is null");
  }
  if (!notifier_) {
    throw std::invalid_argument("ActionDispatcher: notification sink is null");
  }
}

std::vector<v1::ActionResult> ActionDispatcher::Run(const google::protobuf::RepeatedPtrField<v1::Action>& actions, const v1::Routine& routine) const {
  std::vector<v1::ActionResult> results;
  results.reserve(actions.size());
  for (const auto& action : actions) {
    results.push_back(RunOne(action, routine));
  }
  return results;
}

v1::ActionResult ActionDispatcher::RunOne(const v1::Action& action, const v1::Routine& routine) const {
  ROUTINE_LOG_DEBUG("Executing action", {observability::StringField("routine_id", routine.id()), observability::StringField("type", KindName(action))});

  try {
    switch (action.kind_case()) {
      case v1::Action::kConnectorCall:
        return ConnectorCall(action.connector_call());
      case v1::Action::kNotification:
        return Notification(action.notification(), routine);
      case v1::Action::kStateChange:
        return StateChange(action.state_change());
      case v1::Action::kCustom:
        throw util::Unsupported("Unsupported action type: custom");
      case v1::Action::KIND_NOT_SET:
        break;
    }
  } catch (const std::exception& e) {
    ROUTINE_LOG_WARN("Action failed", {observability::StringField("routine_id", routine.id()), observability::StringField("type", KindName(action)),
                                       observability::StringField("error", e.what())});
    return Failed(e.what());
  }

  ROUTINE_LOG_WARN("Unknown action type", {observability::StringField("routine_id", routine.id())});
  return Failed("Unknown action type");
}

v1::ActionResult ActionDispatcher::ConnectorCall(const v1::ConnectorCallAction& action) const {
  if (action.service().empty() || action.method().empty()) {
    return Failed("Connector action missing service or method");
  }

  const auto* handler = connectors_->Find(action.service());
  if (!handler) {
    return Failed("No handler found for service: " + action.service());
  }

  return (*handler)(action.method(), action.parameters());
}

v1::ActionResult ActionDispatcher::Notification(const v1::NotificationAction& action, const v1::Routine& routine) const {
  const auto& parameters = action.parameters();
  const auto  message    = parameters.message().empty() ? "Routine \"" + routine.name() + "\" executed" : parameters.message();
  const auto  title      = parameters.title().empty() ? default_title_ : parameters.title();

  notifier_->Notify(title, message);

  v1::ActionResult result;
  result.set_success(true);
  result.set_message(message);
  return result;
}

v1::ActionResult ActionDispatcher::StateChange(const v1::StateChangeAction& action) const {
  if (!action.service().empty() && action.service() != "homeassistant") {
    throw util::Unsupported("Unsupported state provider: " + action.service());
  }
  if (action.entity().empty() || action.domain().empty() || action.operation().empty()) {
    throw util::ActionError("State change action requires entity, domain and operation");
  }
  if (!state_source_) {
    throw util::Unsupported("No state source configured");
  }

  return state_source_->CallService(action.domain(), action.operation(), action.entity(), action.data());
}

} // namespace routine::action
