#include "internal/connectors/vision_client.hpp"

#include <optional>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routine::connectors {
namespace {

using google::protobuf::Value;

const Value* Field(const Value& object, const char* key) {
  if (object.kind_case() != Value::kStructValue) return nullptr;
  auto it = object.struct_value().fields().find(std::string(key));
  return it == object.struct_value().fields().end() ? nullptr : &it->second;
}

std::string TextField(const Value& object, const char* key) {
  const auto* value = Field(object, key);
  return value && value->kind_case() == Value::kStringValue ? value->string_value() : std::string();
}

std::optional<double> NumberField(const Value& object, const char* key) {
  const auto* value = Field(object, key);
  if (!value || value->kind_case() != Value::kNumberValue) return std::nullopt;
  return value->number_value();
}

const Value* ListField(const Value& object, const char* key) {
  const auto* value = Field(object, key);
  return value && value->kind_case() == Value::kListValue ? value : nullptr;
}

Value ParseResponse(const http::HttpResponse& response, const std::string& backend) {
  if (response.status == 401) {
    throw util::SetupRequired(backend + " authentication failed");
  }
  if (!response.ok()) {
    throw util::ConnectorError(backend + " API error: HTTP " + std::to_string(response.status));
  }
  try {
    return util::ParseJsonValue(response.body);
  } catch (const std::runtime_error& e) {
    throw util::ConnectorError(backend + " returned invalid JSON: " + e.what());
  }
}

std::string JoinLabels(const google::protobuf::RepeatedPtrField<std::string>& labels) {
  std::string out;
  for (const auto& label : labels) {
    if (!out.empty()) out += ',';
    out += label;
  }
  return out;
}

} // namespace

VisionClient::VisionClient(std::shared_ptr<http::HttpClient> http, routine::runtime::config::ConnectorsConfig config)
    : http_(std::move(http)), config_(std::move(config)) {
  if (!http_) {
    throw std::invalid_argument("VisionClient: http client is null");
  }
}

bool VisionClient::FrigateConfigured() const {
  return !config_.frigate().url().empty();
}

bool VisionClient::CodeProjectAiConfigured() const {
  return !config_.codeprojectai().url().empty();
}

bool VisionClient::YoloConfigured() const {
  return !config_.yolo().url().empty();
}

std::vector<trigger::Detection> VisionClient::Detect(const manager::v1::VisionDetectionTrigger& vision) {
  const auto& service = vision.service();
  // backends filter too; the trigger layer re-applies its own threshold
  const double min_confidence = vision.has_min_confidence() ? vision.min_confidence() : 0.5;

  if (service == "frigate") {
    if (vision.camera().empty()) {
      throw util::ConnectorError("Frigate vision trigger requires a camera");
    }

    auto events = FrigateEvents(vision.camera(), JoinLabels(vision.object_types()), config_.frigate().event_limit());

    std::vector<trigger::Detection> detections;
    if (events.kind_case() == Value::kListValue) {
      for (const auto& event : events.list_value().values()) {
        if (!vision.zone().empty()) {
          const auto* zones   = ListField(event, "current_zones");
          bool        in_zone = false;
          if (zones) {
            for (const auto& zone : zones->list_value().values()) {
              in_zone = in_zone || (zone.kind_case() == Value::kStringValue && zone.string_value() == vision.zone());
            }
          }
          if (!in_zone) continue;
        }
        detections.push_back({TextField(event, "label"), NumberField(event, "top_score").value_or(1.0)});
      }
    }
    return detections;
  }

  if (vision.image_source().empty()) {
    throw util::ConnectorError("Vision trigger for " + service + " requires an imageSource");
  }

  if (service == "codeprojectai") {
    return CodeProjectAiDetect(vision.image_source(), min_confidence);
  }
  if (service == "yolo") {
    return YoloDetect(vision.image_source(), min_confidence);
  }
  if (service == "local") {
    return LocalDetect(vision.image_source(), min_confidence);
  }
  throw util::Unsupported("Unknown vision service: " + service);
}

Value VisionClient::FrigateEvents(const std::string& camera, const std::string& label, uint32_t limit) {
  if (!FrigateConfigured()) {
    throw util::SetupRequired("Frigate not configured. Please set FRIGATE_URL environment variable (e.g., \"http://frigate.local:5000\").");
  }

  std::string url = http::JoinUrl(config_.frigate().url(), "/api/events") + "?camera=" + http::QueryEscape(camera) + "&limit=" + std::to_string(limit);
  if (!label.empty()) {
    url += "&label=" + http::QueryEscape(label);
  }

  std::vector<std::string> headers;
  if (!config_.frigate().api_key().empty()) {
    headers.push_back("X-Frigate-API-Key: " + config_.frigate().api_key());
  }

  return ParseResponse(http_->Get(url, headers), "Frigate");
}

std::vector<trigger::Detection> VisionClient::CodeProjectAiDetect(const std::string& image_url, double min_confidence) {
  if (!CodeProjectAiConfigured()) {
    throw util::SetupRequired("CodeProject.AI not configured. Please set CODEPROJECT_AI_URL environment variable (e.g., \"http://localhost:32168\").");
  }

  const auto image = http_->Get(image_url, {});
  if (!image.ok()) {
    throw util::ConnectorError("Failed to fetch image from " + image_url + ": HTTP " + std::to_string(image.status));
  }

  std::vector<http::MultipartPart> parts;
  parts.push_back({"image", "image.jpg", "image/jpeg", image.body});
  parts.push_back({"min_confidence", "", "", std::to_string(min_confidence)});

  auto result = ParseResponse(http_->PostMultipart(http::JoinUrl(config_.codeprojectai().url(), "/v1/vision/detection"), parts, {}), "CodeProject.AI");

  std::vector<trigger::Detection> detections;
  if (const auto* predictions = ListField(result, "predictions")) {
    for (const auto& prediction : predictions->list_value().values()) {
      detections.push_back({TextField(prediction, "label"), NumberField(prediction, "confidence").value_or(0.0)});
    }
  }
  return detections;
}

std::vector<trigger::Detection> VisionClient::YoloDetect(const std::string& image_url, double min_confidence) {
  if (!YoloConfigured()) {
    throw util::SetupRequired("YOLO API not configured. Please set YOLO_API_URL.");
  }
  return DetectJson(config_.yolo().url(), "YOLO", image_url, min_confidence);
}

std::vector<trigger::Detection> VisionClient::LocalDetect(const std::string& image_url, double min_confidence) {
  if (config_.local_vision().url().empty()) {
    throw util::SetupRequired("Local detector not configured. Please set LOCAL_VISION_URL.");
  }
  return DetectJson(config_.local_vision().url(), "Local detector", image_url, min_confidence);
}

std::vector<trigger::Detection> VisionClient::DetectJson(const std::string& base_url, const std::string& name, const std::string& image_url,
                                                         double min_confidence) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["image_url"].set_string_value(image_url);
  (*body.mutable_fields())["confidence"].set_number_value(min_confidence);

  auto result = ParseResponse(http_->PostJson(http::JoinUrl(base_url, "/detect"), util::ToJson(body), {}), name);

  std::vector<trigger::Detection> detections;
  if (const auto* list = ListField(result, "detections")) {
    for (const auto& detection : list->list_value().values()) {
      auto label = TextField(detection, "class");
      if (label.empty()) label = TextField(detection, "label");
      auto confidence = NumberField(detection, "score");
      if (!confidence) confidence = NumberField(detection, "confidence");
      detections.push_back({label, confidence.value_or(0.0)});
    }
  }
  return detections;
}

Value DetectionsToValue(const std::vector<trigger::Detection>& detections) {
  Value out;
  auto* list = out.mutable_list_value();
  for (const auto& detection : detections) {
    auto& fields = *list->add_values()->mutable_struct_value()->mutable_fields();
    fields["label"].set_string_value(detection.label);
    fields["confidence"].set_number_value(detection.confidence);
  }
  return out;
}

} // namespace routine::connectors
