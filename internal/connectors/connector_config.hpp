#pragma once

#include "config/config.pb.h"

namespace routine::connectors {

/*
  Fills empty connector settings from the environment:

    HOME_ASSISTANT_URL, HOME_ASSISTANT_TOKEN
    FRIGATE_URL, FRIGATE_API_KEY
    CODEPROJECT_AI_URL
    YOLO_API_URL
    LOCAL_VISION_URL

  Values present in the configuration file win.
*/
routine::runtime::config::ConnectorsConfig ResolveConnectorsConfig(const routine::runtime::config::ConnectorsConfig& configured);

} // namespace routine::connectors
