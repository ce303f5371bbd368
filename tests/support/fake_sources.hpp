#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/action/notification_sink.hpp"
#include "internal/trigger/state_source.hpp"
#include "internal/trigger/vision_source.hpp"
#include "internal/util/errors.hpp"

namespace routine::testing {

inline google::protobuf::Value StringValue(const std::string& text) {
  google::protobuf::Value value;
  value.set_string_value(text);
  return value;
}

inline google::protobuf::Value NumberValue(double number) {
  google::protobuf::Value value;
  value.set_number_value(number);
  return value;
}

inline google::protobuf::Value BoolValue(bool flag) {
  google::protobuf::Value value;
  value.set_bool_value(flag);
  return value;
}

class FakeStateSource final : public trigger::StateSource {
 public:
  struct ServiceCall {
    std::string              domain;
    std::string              operation;
    std::string              entity;
    google::protobuf::Struct data;
  };

  void SetState(const std::string& entity, google::protobuf::Value state, google::protobuf::Struct attributes = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto&                       entry = states_[entity];
    entry.state                       = std::move(state);
    entry.attributes                  = std::move(attributes);
  }

  void SetAttribute(const std::string& entity, const std::string& key, google::protobuf::Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    (*states_[entity].attributes.mutable_fields())[key] = std::move(value);
  }

  void SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
  }

  trigger::EntityState GetState(const std::string& entity) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads_;
    if (failing_) {
      throw util::ConnectorError("state source unavailable");
    }
    const auto it = states_.find(entity);
    if (it == states_.end()) {
      throw util::ConnectorError("Entity not found: " + entity);
    }
    return it->second;
  }

  manager::v1::ActionResult CallService(const std::string& domain, const std::string& operation, const std::string& entity,
                                        const google::protobuf::Struct& data) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
      throw util::ConnectorError("state source unavailable");
    }
    calls_.push_back({domain, operation, entity, data});

    manager::v1::ActionResult result;
    result.set_success(true);
    result.set_message("Called " + domain + "." + operation + " on " + entity);
    return result;
  }

  std::vector<ServiceCall> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  int Reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex                          mutex_;
  std::map<std::string, trigger::EntityState> states_;
  std::vector<ServiceCall>                    calls_;
  bool                                        failing_ = false;
  int                                         reads_   = 0;
};

class FakeVisionSource final : public trigger::VisionSource {
 public:
  void SetDetections(std::vector<trigger::Detection> detections) {
    std::lock_guard<std::mutex> lock(mutex_);
    detections_ = std::move(detections);
  }

  void SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
  }

  std::vector<trigger::Detection> Detect(const manager::v1::VisionDetectionTrigger& config) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    last_service_ = config.service();
    if (failing_) {
      throw util::ConnectorError("vision backend unavailable");
    }
    return detections_;
  }

  int Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::string LastService() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_service_;
  }

 private:
  mutable std::mutex              mutex_;
  std::vector<trigger::Detection> detections_;
  bool                            failing_ = false;
  int                             calls_   = 0;
  std::string                     last_service_;
};

class RecordingNotificationSink final : public action::NotificationSink {
 public:
  void Notify(const std::string& title, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    notifications_.emplace_back(title, message);
  }

  std::vector<std::pair<std::string, std::string>> Notifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifications_;
  }

 private:
  mutable std::mutex                               mutex_;
  std::vector<std::pair<std::string, std::string>> notifications_;
};

} // namespace routine::testing
