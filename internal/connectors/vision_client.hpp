#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/trigger/vision_source.hpp"

namespace routine::connectors {

/*
  Detection backends behind one VisionSource.

    frigate        GET  <frigate>/api/events?camera=&limit=&label=
    codeprojectai  POST <cpai>/v1/vision/detection (multipart image)
    yolo           POST <yolo>/detect {image_url, confidence}
    local          POST <local>/detect, same contract as yolo

  Unconfigured backends throw util::SetupRequired.
*/
class VisionClient final : public trigger::VisionSource {
 public:
  VisionClient(std::shared_ptr<http::HttpClient> http, routine::runtime::config::ConnectorsConfig config);

  std::vector<trigger::Detection> Detect(const manager::v1::VisionDetectionTrigger& config) override;

  // Frigate event list; label may be a comma-separated set, empty for all.
  google::protobuf::Value FrigateEvents(const std::string& camera, const std::string& label, uint32_t limit);

  std::vector<trigger::Detection> CodeProjectAiDetect(const std::string& image_url, double min_confidence);
  std::vector<trigger::Detection> YoloDetect(const std::string& image_url, double min_confidence);
  std::vector<trigger::Detection> LocalDetect(const std::string& image_url, double min_confidence);

  bool FrigateConfigured() const;
  bool CodeProjectAiConfigured() const;
  bool YoloConfigured() const;

 private:
  std::vector<trigger::Detection> DetectJson(const std::string& base_url, const std::string& name, const std::string& image_url, double min_confidence);

  std::shared_ptr<http::HttpClient>          http_;
  routine::runtime::config::ConnectorsConfig config_;
};

// [{label, confidence}] as a JSON list.
google::protobuf::Value DetectionsToValue(const std::vector<trigger::Detection>& detections);

} // namespace routine::connectors
