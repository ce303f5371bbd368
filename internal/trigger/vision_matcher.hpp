#pragma once

#include <string>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "internal/trigger/vision_source.hpp"

namespace routine::trigger {

// Labels of detections at or above min_confidence that match a target
// type (case-insensitive substring, either direction).
std::vector<std::string> MatchDetections(const std::vector<Detection>& detections,
                                         const google::protobuf::RepeatedPtrField<std::string>& targets, double min_confidence);

// Sorted labels joined by ','.
std::string DetectionSignature(std::vector<std::string> labels);

} // namespace routine::trigger
