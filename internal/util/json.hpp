#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace routine::util {

// Protobuf JSON mapping (lowerCamelCase names). Both throw std::runtime_error.
std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

// Arbitrary JSON document as a protobuf Value.
google::protobuf::Value ParseJsonValue(const std::string& json);

// Compact JSON text of a Value; used for equality checks and logs.
std::string ValueToJson(const google::protobuf::Value& value);

} // namespace routine::util
