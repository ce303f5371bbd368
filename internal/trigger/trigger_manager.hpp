#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/trigger/state_source.hpp"
#include "internal/trigger/timer.hpp"
#include "internal/trigger/vision_source.hpp"
#include "routine/manager/v1/routine.pb.h"

namespace routine::trigger {

enum class TriggerKind { kTime, kStateChange, kVisionDetection, kListener };

enum class ListenerEvent { kEvent, kUserAction, kTaskCompleted };

struct TriggerSettings {
  std::chrono::milliseconds state_poll_interval{30000};
  std::chrono::milliseconds vision_default_interval{10000};
  double                    vision_default_min_confidence = 0.5;
};

// Invoked from timer threads with the id of the routine to run.
using FireCallback = std::function<void(const std::string& routine_id)>;

const char* ToString(TriggerKind kind);

/*
  Owns one TriggerHandle per enabled routine.

  Register() and Deregister() are the only mutators. A handle is either
  a periodic timer (time schedule, state poll, vision poll) or a
  listener that fires only through MatchListeners().

  Trigger configurations that cannot be installed are logged and leave
  the routine without a handle; Register() then returns false.
*/
class TriggerManager {
 public:
  TriggerManager(std::shared_ptr<TimerFactory> timers, std::shared_ptr<StateSource> state_source, std::shared_ptr<VisionSource> vision_source,
                 FireCallback fire, TriggerSettings settings = {});
  ~TriggerManager();

  TriggerManager(const TriggerManager&)            = delete;
  TriggerManager& operator=(const TriggerManager&) = delete;

  // Replaces any handle already registered for routine.id().
  bool Register(const manager::v1::Routine& routine);

  // Idempotent.
  void Deregister(const std::string& routine_id);

  void DeregisterAll();

  bool                       HasTrigger(const std::string& routine_id) const;
  std::optional<TriggerKind> KindOf(const std::string& routine_id) const;
  std::size_t                ActiveCount() const;

  // Ids of listener handles matching the event, in no particular order.
  std::vector<std::string> MatchListeners(ListenerEvent event, const std::string& key) const;

 private:
  struct PollState {
    std::mutex                 mutex;
    std::optional<std::string> last;
  };

  struct TriggerHandle {
    TriggerKind            kind = TriggerKind::kListener;
    manager::v1::Trigger   trigger;
    std::unique_ptr<Timer> timer;
  };

  std::optional<TriggerHandle> BuildHandle(const manager::v1::Routine& routine);
  std::optional<TriggerHandle> BuildTimeHandle(const manager::v1::Routine& routine);
  std::optional<TriggerHandle> BuildStateHandle(const manager::v1::Routine& routine);
  std::optional<TriggerHandle> BuildVisionHandle(const manager::v1::Routine& routine);

  std::shared_ptr<TimerFactory> timers_;
  std::shared_ptr<StateSource>  state_source_;
  std::shared_ptr<VisionSource> vision_source_;
  FireCallback                  fire_;
  TriggerSettings               settings_;

  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, TriggerHandle> handles_;
};

} // namespace routine::trigger
