#pragma once

#include <memory>
#include <string>
#include <vector>

namespace routine::runtime::config {
class NotificationConfig;
}

namespace routine::action {

class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  // Must not throw for delivery failures; those are logged.
  virtual void Notify(const std::string& title, const std::string& message) = 0;
};

class LogNotificationSink final : public NotificationSink {
 public:
  void Notify(const std::string& title, const std::string& message) override;
};

/*
  OS-level notification through an external command, e.g.
  `notify-send <title> <message>`. Only built when desktop
  notifications are enabled in configuration.
*/
class DesktopNotificationSink final : public NotificationSink {
 public:
  explicit DesktopNotificationSink(std::string command);

  void Notify(const std::string& title, const std::string& message) override;

 private:
  std::string command_;
};

class FanoutNotificationSink final : public NotificationSink {
 public:
  explicit FanoutNotificationSink(std::vector<std::shared_ptr<NotificationSink>> sinks);

  void Notify(const std::string& title, const std::string& message) override;

 private:
  std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

// Log sink always; desktop sink when config.desktop_enabled().
std::shared_ptr<NotificationSink> BuildNotificationSink(const routine::runtime::config::NotificationConfig& config);

} // namespace routine::action
