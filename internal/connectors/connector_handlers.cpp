#include "internal/connectors/connector_handlers.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routine::connectors {
namespace {

namespace v1 = routine::manager::v1;
using google::protobuf::Struct;
using google::protobuf::Value;

std::string Param(const Struct& parameters, const char* key) {
  auto it = parameters.fields().find(std::string(key));
  if (it == parameters.fields().end() || it->second.kind_case() != Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

double NumberParam(const Struct& parameters, const char* key, double fallback) {
  auto it = parameters.fields().find(std::string(key));
  if (it == parameters.fields().end() || it->second.kind_case() != Value::kNumberValue) {
    return fallback;
  }
  return it->second.number_value();
}

// serviceData may arrive as an object or as JSON text
Struct StructParam(const Struct& parameters, const char* key) {
  auto it = parameters.fields().find(std::string(key));
  if (it == parameters.fields().end()) {
    return {};
  }
  if (it->second.kind_case() == Value::kStructValue) {
    return it->second.struct_value();
  }
  if (it->second.kind_case() == Value::kStringValue && !it->second.string_value().empty()) {
    Struct parsed;
    try {
      util::FromJson(it->second.string_value(), &parsed);
    } catch (const std::runtime_error&) {
      throw util::ValidationError(std::string("Invalid ") + key + " JSON");
    }
    return parsed;
  }
  return {};
}

v1::ActionResult Failed(const std::string& error) {
  v1::ActionResult result;
  result.set_success(false);
  result.set_error(error);
  return result;
}

v1::ActionResult Succeeded(Value data) {
  v1::ActionResult result;
  result.set_success(true);
  *result.mutable_data() = std::move(data);
  return result;
}

template <typename Handler>
action::ConnectorHandler WithSetupEnvelope(Handler handler) {
  return [handler = std::move(handler)](const std::string& method, const Struct& parameters) -> v1::ActionResult {
    try {
      return handler(method, parameters);
    } catch (const util::SetupRequired& e) {
      v1::ActionResult result;
      result.set_success(false);
      result.set_requires_setup(true);
      result.set_setup_instructions(e.what());
      return result;
    } catch (const util::ValidationError& e) {
      return Failed(e.what());
    }
  };
}

Value DetectionEnvelope(const std::string& image_url, double min_confidence, const std::vector<trigger::Detection>& detections) {
  Value out;
  auto& fields = *out.mutable_struct_value()->mutable_fields();
  fields["imageUrl"].set_string_value(image_url);
  fields["minConfidence"].set_number_value(min_confidence);
  fields["detectionCount"].set_number_value(static_cast<double>(detections.size()));
  fields["detections"] = DetectionsToValue(detections);
  return out;
}

} // namespace

std::shared_ptr<action::ConnectorRegistry> BuildConnectorRegistry(std::shared_ptr<HomeAssistantClient> home_assistant,
                                                                  std::shared_ptr<VisionClient>        vision) {
  if (!home_assistant || !vision) {
    throw std::invalid_argument("BuildConnectorRegistry: connector client is null");
  }

  auto registry = std::make_shared<action::ConnectorRegistry>();

  registry->Register("homeassistant", WithSetupEnvelope([home_assistant](const std::string& method, const Struct& parameters) {
                       if (method == "state") {
                         const auto entity = Param(parameters, "entityId");
                         if (entity.empty()) return Failed("entityId is required");
                         return Succeeded(home_assistant->Entity(entity));
                       }
                       if (method == "devices") {
                         return Succeeded(home_assistant->Devices(Param(parameters, "domain")));
                       }

                       const auto domain  = Param(parameters, "domain");
                       const auto service = Param(parameters, "service");
                       const auto entity  = Param(parameters, "entityId");
                       if (domain.empty() || service.empty() || entity.empty()) {
                         return Failed("domain, service, and entityId are required");
                       }
                       return home_assistant->CallService(domain, service, entity, StructParam(parameters, "serviceData"));
                     }));

  registry->Register("frigate", WithSetupEnvelope([vision](const std::string& method, const Struct& parameters) {
                       if (method != "events") return Failed("Unsupported frigate method: " + method);

                       const auto camera = Param(parameters, "camera");
                       if (camera.empty()) return Failed("camera is required");

                       const auto label  = Param(parameters, "objectType");
                       const auto limit  = static_cast<uint32_t>(NumberParam(parameters, "limit", 10));
                       auto       events = vision->FrigateEvents(camera, label, limit);

                       Value out;
                       auto& fields = *out.mutable_struct_value()->mutable_fields();
                       fields["camera"].set_string_value(camera);
                       fields["objectType"].set_string_value(label.empty() ? "all" : label);
                       fields["eventCount"].set_number_value(events.kind_case() == Value::kListValue ? events.list_value().values_size() : 0);
                       fields["events"] = std::move(events);
                       return Succeeded(std::move(out));
                     }));

  registry->Register("codeprojectai", WithSetupEnvelope([vision](const std::string& method, const Struct& parameters) {
                       if (method != "detect") return Failed("Unsupported codeprojectai method: " + method);

                       const auto image_url = Param(parameters, "imageUrl");
                       if (image_url.empty()) return Failed("imageUrl is required");

                       const double min_confidence = NumberParam(parameters, "minConfidence", 0.5);
                       return Succeeded(DetectionEnvelope(image_url, min_confidence, vision->CodeProjectAiDetect(image_url, min_confidence)));
                     }));

  registry->Register("yolo", WithSetupEnvelope([vision](const std::string& method, const Struct& parameters) {
                       if (method != "detect") return Failed("Unsupported yolo method: " + method);

                       const auto image_url = Param(parameters, "imageUrl");
                       if (image_url.empty()) return Failed("imageUrl is required");

                       const double min_confidence = NumberParam(parameters, "minConfidence", 0.5);
                       return Succeeded(DetectionEnvelope(image_url, min_confidence, vision->YoloDetect(image_url, min_confidence)));
                     }));

  return registry;
}

} // namespace routine::connectors
