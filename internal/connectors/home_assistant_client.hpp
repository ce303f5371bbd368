#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/trigger/state_source.hpp"

namespace routine::connectors {

inline constexpr const char* kHomeAssistantSetup =
    "Home Assistant not configured. Please set HOME_ASSISTANT_URL and HOME_ASSISTANT_TOKEN environment variables.";

/*
  Home Assistant REST client.

    GET  /api/states                      devices
    GET  /api/states/<entity>             state
    POST /api/services/<domain>/<service> control

  Bearer-token auth. Missing url/token or a 401 throws util::SetupRequired;
  other failures throw util::ConnectorError.
*/
class HomeAssistantClient final : public trigger::StateSource {
 public:
  HomeAssistantClient(std::shared_ptr<http::HttpClient> http, routine::runtime::config::HomeAssistantConfig config);

  bool Configured() const;

  trigger::EntityState GetState(const std::string& entity) override;

  manager::v1::ActionResult CallService(const std::string& domain, const std::string& operation, const std::string& entity,
                                        const google::protobuf::Struct& data) override;

  // {entityId, state, friendlyName, domain, attributes, lastChanged, lastUpdated}
  google::protobuf::Value Entity(const std::string& entity);

  // Every entity, optionally restricted to one domain ("light").
  google::protobuf::Value Devices(const std::string& domain);

 private:
  google::protobuf::Value  Fetch(const std::string& path, const std::string& what);
  std::vector<std::string> Headers() const;
  void                     RequireConfigured() const;

  std::shared_ptr<http::HttpClient>             http_;
  routine::runtime::config::HomeAssistantConfig config_;
};

} // namespace routine::connectors
