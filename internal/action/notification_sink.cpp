#include "internal/action/notification_sink.hpp"

#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

extern char** environ;

namespace routine::action {

void LogNotificationSink::Notify(const std::string& title, const std::string& message) {
  ROUTINE_LOG_INFO("Notification", {observability::StringField("title", title), observability::StringField("message", message)});
}

DesktopNotificationSink::DesktopNotificationSink(std::string command) : command_(std::move(command)) {
}

void DesktopNotificationSink::Notify(const std::string& title, const std::string& message) {
  std::string title_arg   = title;
  std::string message_arg = message;
  char*       argv[]      = {command_.data(), title_arg.data(), message_arg.data(), nullptr};

  pid_t pid = 0;
  int   rc  = posix_spawnp(&pid, command_.c_str(), nullptr, nullptr, argv, environ);
  if (rc != 0) {
    ROUTINE_LOG_WARN("Desktop notification failed", {observability::StringField("command", command_), observability::StringField("error", std::strerror(rc))});
    return;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      ROUTINE_LOG_WARN("Desktop notification wait failed", {observability::StringField("error", std::strerror(errno))});
      return;
    }
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    ROUTINE_LOG_WARN("Desktop notification command exited abnormally", {observability::StringField("command", command_), observability::IntField("status", status)});
  }
}

FanoutNotificationSink::FanoutNotificationSink(std::vector<std::shared_ptr<NotificationSink>> sinks) : sinks_(std::move(sinks)) {
}

void FanoutNotificationSink::Notify(const std::string& title, const std::string& message) {
  for (const auto& sink : sinks_) {
    sink->Notify(title, message);
  }
}

std::shared_ptr<NotificationSink> BuildNotificationSink(const routine::runtime::config::NotificationConfig& config) {
  std::vector<std::shared_ptr<NotificationSink>> sinks;
  sinks.push_back(std::make_shared<LogNotificationSink>());

  if (config.desktop_enabled()) {
    sinks.push_back(std::make_shared<DesktopNotificationSink>(config.command().empty() ? "notify-send" : config.command()));
  }

  return std::make_shared<FanoutNotificationSink>(std::move(sinks));
}

} // namespace routine::action
