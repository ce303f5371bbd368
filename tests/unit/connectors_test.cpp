#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/connectors/connector_config.hpp"
#include "internal/connectors/connector_handlers.hpp"
#include "internal/connectors/home_assistant_client.hpp"
#include "internal/connectors/vision_client.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_http_client.hpp"

namespace {

namespace v1 = routine::manager::v1;
using routine::connectors::HomeAssistantClient;
using routine::connectors::VisionClient;
using routine::runtime::config::ConnectorsConfig;
using routine::runtime::config::HomeAssistantConfig;
using routine::testing::FakeHttpClient;

constexpr const char* kKitchen = R"({"entity_id":"light.kitchen","state":"on","attributes":{"friendly_name":"Kitchen","brightness":200},"last_changed":"2024-06-15T10:00:00Z"})";
constexpr const char* kStates  = R"([
  {"entity_id":"light.kitchen","state":"on","attributes":{"friendly_name":"Kitchen"}},
  {"entity_id":"switch.fan","state":"off","attributes":{}},
  {"entity_id":"light.porch","state":"off"}
])";

HomeAssistantConfig HomeAssistant() {
  HomeAssistantConfig config;
  config.set_url("http://ha.local:8123/");
  config.set_token("secret");
  return config;
}

ConnectorsConfig Connectors() {
  ConnectorsConfig config;
  *config.mutable_home_assistant() = HomeAssistant();
  config.mutable_frigate()->set_url("http://frigate.local:5000");
  config.mutable_frigate()->set_event_limit(5);
  config.mutable_codeprojectai()->set_url("http://cpai.local:32168");
  config.mutable_yolo()->set_url("http://yolo.local:8000");
  return config;
}

google::protobuf::Value Field(const google::protobuf::Value& object, const std::string& key) {
  return object.struct_value().fields().at(key);
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestHomeAssistantReadsState() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("GET", "http://ha.local:8123/api/states/light.kitchen", 200, kKitchen);
  HomeAssistantClient client(http, HomeAssistant());

  const auto state = client.GetState("light.kitchen");
  assert(state.state.string_value() == "on");
  assert(state.attributes.fields().at("brightness").number_value() == 200);

  const auto requests = http->Requests();
  assert(requests.size() == 1);
  assert(requests[0].headers.at(0) == "Authorization: Bearer secret");

  const auto entity = client.Entity("light.kitchen");
  assert(Field(entity, "entityId").string_value() == "light.kitchen");
  assert(Field(entity, "domain").string_value() == "light");
  assert(Field(entity, "friendlyName").string_value() == "Kitchen");
  assert(Field(entity, "lastChanged").string_value() == "2024-06-15T10:00:00Z");
}

void TestHomeAssistantErrors() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("GET", "http://ha.local:8123/api/states/light.kitchen", 401, "");
  HomeAssistantClient client(http, HomeAssistant());

  assert(Throws<routine::util::SetupRequired>([&] { client.GetState("light.kitchen"); }));
  assert(Throws<routine::util::ConnectorError>([&] { client.GetState("light.missing"); }));

  http->SetUnreachable(true);
  assert(Throws<routine::util::ConnectorError>([&] { client.GetState("light.kitchen"); }));

  HomeAssistantClient unconfigured(http, HomeAssistantConfig());
  assert(!unconfigured.Configured());
  const auto before = http->Requests().size();
  assert(Throws<routine::util::SetupRequired>([&] { unconfigured.GetState("light.kitchen"); }));
  assert(http->Requests().size() == before);
}

void TestHomeAssistantCallsService() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("POST", "http://ha.local:8123/api/services/light/turn_on", 200, "[]");
  HomeAssistantClient client(http, HomeAssistant());

  google::protobuf::Struct data;
  (*data.mutable_fields())["brightness"].set_number_value(128);

  const auto result = client.CallService("light", "turn_on", "light.kitchen", data);
  assert(result.success());
  assert(result.message() == "Called light.turn_on on light.kitchen");
  assert(Field(result.data(), "service").string_value() == "light.turn_on");

  const auto request = http->Requests().back();
  assert(request.method == "POST");
  assert(request.body.find("\"entity_id\":\"light.kitchen\"") != std::string::npos);
  assert(request.body.find("\"brightness\":128") != std::string::npos);

  assert(Throws<routine::util::ConnectorError>([&] { client.CallService("light", "explode", "light.kitchen", {}); }));
}

void TestHomeAssistantListsDevicesByDomain() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("GET", "http://ha.local:8123/api/states", 200, kStates);
  HomeAssistantClient client(http, HomeAssistant());

  const auto all = client.Devices("");
  assert(Field(all, "deviceCount").number_value() == 3);
  assert(Field(all, "domain").string_value() == "all");

  const auto lights = client.Devices("light");
  assert(Field(lights, "deviceCount").number_value() == 2);
  const auto& devices = Field(lights, "devices").list_value();
  assert(Field(devices.values(1), "friendlyName").string_value() == "light.porch");
}

void TestFrigateDetectionsFilterByZone() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("GET", "http://frigate.local:5000/api/events?camera=driveway&limit=5&label=person%2Ccar", 200,
              R"([{"label":"person","top_score":0.91,"current_zones":["porch"]},{"label":"car","current_zones":["street"]},{"label":"person"}])");
  VisionClient client(http, Connectors());

  v1::VisionDetectionTrigger trigger;
  trigger.set_service("frigate");
  trigger.set_camera("driveway");
  trigger.add_object_types("person");
  trigger.add_object_types("car");

  auto detections = client.Detect(trigger);
  assert(detections.size() == 3);
  assert(detections[0].label == "person" && detections[0].confidence == 0.91);
  assert(detections[1].confidence == 1.0);

  trigger.set_zone("porch");
  detections = client.Detect(trigger);
  assert(detections.size() == 1);
  assert(detections[0].label == "person");

  trigger.clear_camera();
  assert(Throws<routine::util::ConnectorError>([&] { client.Detect(trigger); }));
}

void TestCodeProjectAiUploadsImage() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("GET", "http://cam.local/snapshot.jpg", 200, "JPEGDATA");
  http->Route("POST", "http://cpai.local:32168/v1/vision/detection", 200,
              R"({"success":true,"predictions":[{"label":"dog","confidence":0.66},{"label":"person","confidence":0.9}]})");
  VisionClient client(http, Connectors());

  const auto detections = client.CodeProjectAiDetect("http://cam.local/snapshot.jpg", 0.4);
  assert(detections.size() == 2);
  assert(detections[1].label == "person");

  const auto upload = http->Requests().back();
  assert(upload.parts.size() == 2);
  assert(upload.parts[0].name == "image");
  assert(upload.parts[0].data == "JPEGDATA");
  assert(upload.parts[1].name == "min_confidence");
}

void TestYoloAcceptsBothFieldSpellings() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("POST", "http://yolo.local:8000/detect", 200, R"({"detections":[{"class":"cat","score":0.8},{"label":"dog","confidence":0.7}]})");
  VisionClient client(http, Connectors());

  v1::VisionDetectionTrigger trigger;
  trigger.set_service("yolo");
  trigger.set_image_source("http://cam.local/snapshot.jpg");

  const auto detections = client.Detect(trigger);
  assert(detections.size() == 2);
  assert(detections[0].label == "cat" && detections[0].confidence == 0.8);
  assert(detections[1].label == "dog" && detections[1].confidence == 0.7);
  assert(http->Requests().back().body.find("\"image_url\":\"http://cam.local/snapshot.jpg\"") != std::string::npos);

  trigger.clear_image_source();
  assert(Throws<routine::util::ConnectorError>([&] { client.Detect(trigger); }));
}

void TestVisionBackendsRequireSetup() {
  auto         http = std::make_shared<FakeHttpClient>();
  VisionClient client(http, ConnectorsConfig());

  v1::VisionDetectionTrigger trigger;
  trigger.set_service("local");
  trigger.set_image_source("http://cam.local/snapshot.jpg");
  assert(Throws<routine::util::SetupRequired>([&] { client.Detect(trigger); }));

  trigger.set_service("yolo");
  assert(Throws<routine::util::SetupRequired>([&] { client.Detect(trigger); }));

  trigger.set_service("deepstack");
  assert(Throws<routine::util::Unsupported>([&] { client.Detect(trigger); }));

  assert(Throws<routine::util::SetupRequired>([&] { client.FrigateEvents("driveway", "", 5); }));
  assert(http->Requests().empty());
}

void TestHandlersWrapSetupErrors() {
  auto http     = std::make_shared<FakeHttpClient>();
  auto registry = routine::connectors::BuildConnectorRegistry(std::make_shared<HomeAssistantClient>(http, HomeAssistantConfig()),
                                                              std::make_shared<VisionClient>(http, ConnectorsConfig()));

  const auto services = registry->Services();
  assert(services.size() == 4);

  google::protobuf::Struct parameters;
  (*parameters.mutable_fields())["entityId"].set_string_value("light.kitchen");
  const auto result = (*registry->Find("homeassistant"))("state", parameters);
  assert(!result.success());
  assert(result.requires_setup());
  assert(result.setup_instructions() == routine::connectors::kHomeAssistantSetup);

  const auto missing = (*registry->Find("homeassistant"))("control", parameters);
  assert(!missing.success());
  assert(missing.error() == "domain, service, and entityId are required");

  const auto unsupported = (*registry->Find("frigate"))("snapshot", {});
  assert(unsupported.error() == "Unsupported frigate method: snapshot");
}

void TestHandlersCallBackends() {
  auto http = std::make_shared<FakeHttpClient>();
  http->Route("POST", "http://ha.local:8123/api/services/switch/toggle", 200, "");
  http->Route("GET", "http://frigate.local:5000/api/events?camera=garage&limit=3", 200, R"([{"label":"car"}])");
  auto registry = routine::connectors::BuildConnectorRegistry(std::make_shared<HomeAssistantClient>(http, HomeAssistant()),
                                                              std::make_shared<VisionClient>(http, Connectors()));

  google::protobuf::Struct control;
  auto&                    fields = *control.mutable_fields();
  fields["domain"].set_string_value("switch");
  fields["service"].set_string_value("toggle");
  fields["entityId"].set_string_value("switch.fan");
  fields["serviceData"].set_string_value(R"({"transition":2})");
  const auto toggled = (*registry->Find("homeassistant"))("control", control);
  assert(toggled.success());
  assert(http->Requests().back().body.find("\"transition\":2") != std::string::npos);

  fields["serviceData"].set_string_value("{not json");
  const auto invalid = (*registry->Find("homeassistant"))("control", control);
  assert(!invalid.success());
  assert(invalid.error() == "Invalid serviceData JSON");

  google::protobuf::Struct events;
  (*events.mutable_fields())["camera"].set_string_value("garage");
  (*events.mutable_fields())["limit"].set_number_value(3);
  const auto listed = (*registry->Find("frigate"))("events", events);
  assert(listed.success());
  assert(Field(listed.data(), "eventCount").number_value() == 1);
  assert(Field(listed.data(), "objectType").string_value() == "all");
}

void TestEnvironmentFillsMissingSettings() {
  setenv("HOME_ASSISTANT_URL", "http://env-ha:8123", 1);
  setenv("YOLO_API_URL", "http://env-yolo", 1);

  ConnectorsConfig configured;
  configured.mutable_yolo()->set_url("http://file-yolo");

  const auto resolved = routine::connectors::ResolveConnectorsConfig(configured);
  assert(resolved.home_assistant().url() == "http://env-ha:8123");
  assert(resolved.yolo().url() == "http://file-yolo");
  assert(resolved.frigate().event_limit() == 5);

  unsetenv("HOME_ASSISTANT_URL");
  unsetenv("YOLO_API_URL");
}

} // namespace

int main() {
  TestHomeAssistantReadsState();
  TestHomeAssistantErrors();
  TestHomeAssistantCallsService();
  TestHomeAssistantListsDevicesByDomain();
  TestFrigateDetectionsFilterByZone();
  TestCodeProjectAiUploadsImage();
  TestYoloAcceptsBothFieldSpellings();
  TestVisionBackendsRequireSetup();
  TestHandlersWrapSetupErrors();
  TestHandlersCallBackends();
  TestEnvironmentFillsMissingSettings();

  std::cout << "routine_manager_unit_connectors: pass\n";
  return 0;
}
