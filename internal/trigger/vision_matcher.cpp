#include "internal/trigger/vision_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace routine::trigger {
namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

std::vector<std::string> MatchDetections(const std::vector<Detection>& detections, const google::protobuf::RepeatedPtrField<std::string>& targets,
                                         double min_confidence) {
  std::vector<std::string> matched;
  for (const auto& detection : detections) {
    if (detection.label.empty() || detection.confidence < min_confidence) {
      continue;
    }

    const auto label = Lower(detection.label);
    const bool hit   = std::any_of(targets.begin(), targets.end(), [&](const std::string& target) {
      const auto wanted = Lower(target);
      return Contains(label, wanted) || Contains(wanted, label);
    });
    if (hit) {
      matched.push_back(detection.label);
    }
  }
  return matched;
}

std::string DetectionSignature(std::vector<std::string> labels) {
  std::sort(labels.begin(), labels.end());

  std::string signature;
  for (const auto& label : labels) {
    if (!signature.empty()) signature += ',';
    signature += label;
  }
  return signature;
}

} // namespace routine::trigger
