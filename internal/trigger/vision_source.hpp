#pragma once

#include <string>
#include <vector>

#include "routine/manager/v1/routine.pb.h"

namespace routine::trigger {

struct Detection {
  std::string label;
  double      confidence = 0.0;
};

/*
  Vision-detection source.

  Detect() queries the backend named by config.service() and returns the
  raw detections; filtering and matching happen in the trigger layer.
  Throws util::ConnectorError on backend failure, util::Unsupported for
  an unknown service.
*/
class VisionSource {
 public:
  virtual ~VisionSource() = default;

  virtual std::vector<Detection> Detect(const manager::v1::VisionDetectionTrigger& config) = 0;
};

} // namespace routine::trigger
