#include "internal/util/json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace routine::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + message.GetTypeName() + " as JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode " + message->GetTypeName() + " from JSON: " + std::string(status.message()));
  }
}

google::protobuf::Value ParseJsonValue(const std::string& json) {
  google::protobuf::Value value;
  FromJson(json, &value);
  return value;
}

std::string ValueToJson(const google::protobuf::Value& value) {
  return ToJson(value);
}

} // namespace routine::util
