#pragma once

#include <memory>

#include "internal/action/connector_registry.hpp"
#include "internal/connectors/home_assistant_client.hpp"
#include "internal/connectors/vision_client.hpp"

namespace routine::connectors {

/*
  Registers the built-in connectors:

    homeassistant  control (any other method), state, devices
    frigate        events
    codeprojectai  detect
    yolo           detect

  Unconfigured integrations answer {success:false, requiresSetup:true}.
*/
std::shared_ptr<action::ConnectorRegistry> BuildConnectorRegistry(std::shared_ptr<HomeAssistantClient> home_assistant,
                                                                  std::shared_ptr<VisionClient>        vision);

} // namespace routine::connectors
