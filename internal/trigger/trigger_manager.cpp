#include "internal/trigger/trigger_manager.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/trigger/schedule.hpp"
#include "internal/trigger/vision_matcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routine::trigger {
namespace {

namespace v1 = routine::manager::v1;
using observability::IntField;
using observability::StringField;

bool IsVisionService(const std::string& service) {
  return service == "local" || service == "frigate" || service == "codeprojectai" || service == "yolo";
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Runs one poll; any failure is reported as a PollError and the timer keeps going.
template <typename Poll>
void RunPoll(const std::string& routine_id, const char* what, Poll&& poll) {
  try {
    try {
      poll();
    } catch (const util::PollError&) {
      throw;
    } catch (const std::exception& e) {
      throw util::PollError(std::string(what) + " poll failed: " + e.what());
    }
  } catch (const util::PollError& e) {
    ROUTINE_LOG_WARN("Trigger poll failed", {StringField("routine_id", routine_id), StringField("error", e.what())});
  }
}

} // namespace

const char* ToString(TriggerKind kind) {
  switch (kind) {
    case TriggerKind::kTime:
      return "time";
    case TriggerKind::kStateChange:
      return "state_change";
    case TriggerKind::kVisionDetection:
      return "vision_detection";
    case TriggerKind::kListener:
      return "listener";
  }
  return "unknown";
}

TriggerManager::TriggerManager(std::shared_ptr<TimerFactory> timers, std::shared_ptr<StateSource> state_source,
                               std::shared_ptr<VisionSource> vision_source, FireCallback fire, TriggerSettings settings)
    : timers_(std::move(timers)), state_source_(std::move(state_source)), vision_source_(std::move(vision_source)), fire_(std::move(fire)),
      settings_(settings) {
  if (!timers_) {
    throw std::invalid_argument("TriggerManager: timer factory is null");
  }
  if (!fire_) {
    throw std::invalid_argument("TriggerManager: fire callback is empty");
  }
}

TriggerManager::~TriggerManager() {
  DeregisterAll();
}

bool TriggerManager::Register(const v1::Routine& routine) {
  // Timers are created outside the lock; a first poll may already be running.
  auto handle = BuildHandle(routine);
  if (!handle) {
    Deregister(routine.id());
    return false;
  }

  const auto kind = handle->kind;
  std::optional<TriggerHandle> replaced;
  {
    std::scoped_lock lock(mutex_);
    auto             it = handles_.find(routine.id());
    if (it != handles_.end()) {
      replaced = std::move(it->second);
      it->second = std::move(*handle);
    } else {
      handles_.emplace(routine.id(), std::move(*handle));
    }
  }

  if (replaced && replaced->timer) {
    replaced->timer->Cancel();
  }

  ROUTINE_LOG_INFO("Registered trigger", {StringField("routine_id", routine.id()), StringField("name", routine.name()), StringField("kind", ToString(kind))});
  return true;
}

void TriggerManager::Deregister(const std::string& routine_id) {
  std::optional<TriggerHandle> removed;
  {
    std::scoped_lock lock(mutex_);
    auto             it = handles_.find(routine_id);
    if (it == handles_.end()) {
      return;
    }
    removed = std::move(it->second);
    handles_.erase(it);
  }

  if (removed->timer) {
    removed->timer->Cancel();
  }
  ROUTINE_LOG_INFO("Removed trigger", {StringField("routine_id", routine_id), StringField("kind", ToString(removed->kind))});
}

void TriggerManager::DeregisterAll() {
  std::unordered_map<std::string, TriggerHandle> removed;
  {
    std::scoped_lock lock(mutex_);
    removed.swap(handles_);
  }

  for (auto& [_, handle] : removed) {
    if (handle.timer) {
      handle.timer->Cancel();
    }
  }
}

bool TriggerManager::HasTrigger(const std::string& routine_id) const {
  std::scoped_lock lock(mutex_);
  return handles_.contains(routine_id);
}

std::optional<TriggerKind> TriggerManager::KindOf(const std::string& routine_id) const {
  std::scoped_lock lock(mutex_);
  auto             it = handles_.find(routine_id);
  if (it == handles_.end()) {
    return std::nullopt;
  }
  return it->second.kind;
}

std::size_t TriggerManager::ActiveCount() const {
  std::scoped_lock lock(mutex_);
  return handles_.size();
}

std::vector<std::string> TriggerManager::MatchListeners(ListenerEvent event, const std::string& key) const {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> matched;
  for (const auto& [routine_id, handle] : handles_) {
    if (handle.kind != TriggerKind::kListener) {
      continue;
    }

    const auto& trigger = handle.trigger;
    bool        hit     = false;
    switch (event) {
      case ListenerEvent::kEvent:
        hit = trigger.has_event() && trigger.event().event_name() == key;
        break;
      case ListenerEvent::kUserAction:
        hit = trigger.has_user_action() && trigger.user_action().action_type() == key;
        break;
      case ListenerEvent::kTaskCompleted:
        if (trigger.has_completion()) {
          const auto pattern = Lower(trigger.completion().task_pattern());
          hit                = pattern.empty() || Lower(key).find(pattern) != std::string::npos;
        }
        break;
    }

    if (hit) {
      matched.push_back(routine_id);
    }
  }
  return matched;
}

std::optional<TriggerManager::TriggerHandle> TriggerManager::BuildHandle(const v1::Routine& routine) {
  switch (routine.trigger().kind_case()) {
    case v1::Trigger::kTime:
      return BuildTimeHandle(routine);
    case v1::Trigger::kStateChange:
      return BuildStateHandle(routine);
    case v1::Trigger::kVisionDetection:
      return BuildVisionHandle(routine);
    case v1::Trigger::kEvent:
    case v1::Trigger::kUserAction:
    case v1::Trigger::kCompletion: {
      TriggerHandle handle;
      handle.kind    = TriggerKind::kListener;
      handle.trigger = routine.trigger();
      return handle;
    }
    case v1::Trigger::KIND_NOT_SET:
      break;
  }

  ROUTINE_LOG_WARN("Routine has no trigger type, trigger not installed", {StringField("routine_id", routine.id())});
  return std::nullopt;
}

std::optional<TriggerManager::TriggerHandle> TriggerManager::BuildTimeHandle(const v1::Routine& routine) {
  const auto& schedule = routine.trigger().time().schedule();
  if (schedule.empty()) {
    ROUTINE_LOG_WARN("Time trigger has no schedule", {StringField("routine_id", routine.id())});
    return std::nullopt;
  }

  auto period = ParseSchedule(schedule);
  if (!period) {
    ROUTINE_LOG_WARN("Invalid schedule, trigger not installed", {StringField("routine_id", routine.id()), StringField("schedule", schedule)});
    return std::nullopt;
  }

  TriggerHandle handle;
  handle.kind    = TriggerKind::kTime;
  handle.trigger = routine.trigger();
  handle.timer   = timers_->Every(*period, [fire = fire_, id = routine.id()] { fire(id); }, false);

  ROUTINE_LOG_DEBUG("Time trigger installed", {StringField("routine_id", routine.id()), IntField("period_ms", period->count())});
  return handle;
}

std::optional<TriggerManager::TriggerHandle> TriggerManager::BuildStateHandle(const v1::Routine& routine) {
  const auto& monitor = routine.trigger().state_change().monitor();
  if (monitor.service().empty() || monitor.entity().empty()) {
    ROUTINE_LOG_WARN("State change trigger missing service or entity", {StringField("routine_id", routine.id())});
    return std::nullopt;
  }
  if (monitor.service() != "homeassistant") {
    ROUTINE_LOG_WARN("State change monitoring only supports homeassistant",
                     {StringField("routine_id", routine.id()), StringField("service", monitor.service())});
    return std::nullopt;
  }
  if (!state_source_) {
    ROUTINE_LOG_WARN("No state source configured, trigger not installed", {StringField("routine_id", routine.id())});
    return std::nullopt;
  }

  auto poll = [state_source = state_source_, fire = fire_, id = routine.id(), monitor, last = std::make_shared<PollState>()] {
    RunPoll(id, "state", [&] {
      const auto observed = util::ValueToJson(ObservedValue(state_source->GetState(monitor.entity()), monitor.property()));

      bool changed = false;
      {
        std::scoped_lock lock(last->mutex);
        // first successful poll only records the baseline
        changed    = last->last.has_value() && *last->last != observed;
        last->last = observed;
      }

      if (changed) {
        ROUTINE_LOG_INFO("State change detected", {StringField("routine_id", id), StringField("entity", monitor.entity()), StringField("value", observed)});
        fire(id);
      }
    });
  };

  TriggerHandle handle;
  handle.kind    = TriggerKind::kStateChange;
  handle.trigger = routine.trigger();
  handle.timer   = timers_->Every(settings_.state_poll_interval, std::move(poll), true);
  return handle;
}

std::optional<TriggerManager::TriggerHandle> TriggerManager::BuildVisionHandle(const v1::Routine& routine) {
  const auto& config = routine.trigger().vision_detection();
  if (!IsVisionService(config.service())) {
    ROUTINE_LOG_WARN("Unsupported vision service, trigger not installed", {StringField("routine_id", routine.id()), StringField("service", config.service())});
    return std::nullopt;
  }
  if (config.object_types().empty()) {
    ROUTINE_LOG_WARN("Vision detection trigger has no object types", {StringField("routine_id", routine.id())});
    return std::nullopt;
  }
  if (!vision_source_) {
    ROUTINE_LOG_WARN("No vision source configured, trigger not installed", {StringField("routine_id", routine.id())});
    return std::nullopt;
  }

  const auto interval =
      config.has_check_interval() && config.check_interval() > 0 ? std::chrono::milliseconds(config.check_interval()) : settings_.vision_default_interval;
  const double min_confidence = config.has_min_confidence() ? config.min_confidence() : settings_.vision_default_min_confidence;

  auto poll = [vision_source = vision_source_, fire = fire_, id = routine.id(), config, min_confidence, last = std::make_shared<PollState>()] {
    RunPoll(id, "vision", [&] {
      const auto matched   = MatchDetections(vision_source->Detect(config), config.object_types(), min_confidence);
      const auto signature = DetectionSignature(matched);

      bool fire_now = false;
      {
        std::scoped_lock lock(last->mutex);
        fire_now   = !matched.empty() && (!last->last || *last->last != signature);
        last->last = signature;
      }

      if (fire_now) {
        ROUTINE_LOG_INFO("Vision detection triggered", {StringField("routine_id", id), StringField("detected", signature)});
        fire(id);
      }
    });
  };

  TriggerHandle handle;
  handle.kind    = TriggerKind::kVisionDetection;
  handle.trigger = routine.trigger();
  handle.timer   = timers_->Every(interval, std::move(poll), true);
  return handle;
}

} // namespace routine::trigger
