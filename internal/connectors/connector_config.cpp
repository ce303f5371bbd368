#include "internal/connectors/connector_config.hpp"

#include <cstdlib>
#include <string>

namespace routine::connectors {
namespace {

void FillFromEnv(std::string* value, const char* name) {
  if (!value->empty()) {
    return;
  }
  if (const char* env = std::getenv(name)) {
    *value = env;
  }
}

} // namespace

routine::runtime::config::ConnectorsConfig ResolveConnectorsConfig(const routine::runtime::config::ConnectorsConfig& configured) {
  auto resolved = configured;

  FillFromEnv(resolved.mutable_home_assistant()->mutable_url(), "HOME_ASSISTANT_URL");
  FillFromEnv(resolved.mutable_home_assistant()->mutable_token(), "HOME_ASSISTANT_TOKEN");
  FillFromEnv(resolved.mutable_frigate()->mutable_url(), "FRIGATE_URL");
  FillFromEnv(resolved.mutable_frigate()->mutable_api_key(), "FRIGATE_API_KEY");
  FillFromEnv(resolved.mutable_codeprojectai()->mutable_url(), "CODEPROJECT_AI_URL");
  FillFromEnv(resolved.mutable_yolo()->mutable_url(), "YOLO_API_URL");
  FillFromEnv(resolved.mutable_local_vision()->mutable_url(), "LOCAL_VISION_URL");

  if (resolved.request_timeout_ms() == 0) {
    resolved.set_request_timeout_ms(10000);
  }
  if (resolved.frigate().event_limit() == 0) {
    resolved.mutable_frigate()->set_event_limit(5);
  }

  return resolved;
}

} // namespace routine::connectors
