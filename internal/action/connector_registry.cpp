#include "internal/action/connector_registry.hpp"

#include "internal/util/errors.hpp"

namespace routine::action {

void ConnectorRegistry::Register(const std::string& service, ConnectorHandler handler) {
  if (service.empty()) {
    throw util::ValidationError("connector service id is empty");
  }
  if (!handler) {
    throw util::ValidationError("connector handler for " + service + " is empty");
  }
  if (!handlers_.emplace(service, std::move(handler)).second) {
    throw util::AlreadyExists("connector already registered: " + service);
  }
}

const ConnectorHandler* ConnectorRegistry::Find(const std::string& service) const {
  auto it = handlers_.find(service);
  return it == handlers_.end() ? nullptr : &it->second;
}

std::vector<std::string> ConnectorRegistry::Services() const {
  std::vector<std::string> services;
  services.reserve(handlers_.size());
  for (const auto& [service, _] : handlers_) {
    services.push_back(service);
  }
  return services;
}

} // namespace routine::action
