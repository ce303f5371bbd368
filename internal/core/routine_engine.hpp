#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "internal/action/action_dispatcher.hpp"
#include "internal/action/connector_registry.hpp"
#include "internal/action/notification_sink.hpp"
#include "internal/core/condition_evaluator.hpp"
#include "internal/store/record_store.hpp"
#include "internal/trigger/state_source.hpp"
#include "internal/trigger/timer.hpp"
#include "internal/trigger/trigger_manager.hpp"
#include "internal/trigger/vision_source.hpp"
#include "internal/util/time.hpp"
#include "routine/manager/v1.hpp"

namespace routine::core {

struct NewRoutine {
  std::string                                                 name;
  std::string                                                 description;
  manager::v1::Trigger                                        trigger;
  google::protobuf::RepeatedPtrField<manager::v1::Condition> conditions;
  google::protobuf::RepeatedPtrField<manager::v1::Action>    actions;
  std::vector<std::string>                                    tags;
  std::string                                                 created_from_task;
};

// Unset members are left untouched by UpdateRoutine.
struct RoutinePatch {
  std::optional<std::string>                                                name;
  std::optional<std::string>                                                description;
  std::optional<bool>                                                       enabled;
  std::optional<manager::v1::Trigger>                                       trigger;
  std::optional<google::protobuf::RepeatedPtrField<manager::v1::Condition>> conditions;
  std::optional<google::protobuf::RepeatedPtrField<manager::v1::Action>>    actions;
  std::optional<std::vector<std::string>>                                   tags;
};

struct EngineDependencies {
  std::shared_ptr<store::RecordStore>              store;
  std::shared_ptr<trigger::TimerFactory>           timers;
  std::shared_ptr<trigger::StateSource>            state_source;
  std::shared_ptr<trigger::VisionSource>           vision_source;
  std::shared_ptr<const action::ConnectorRegistry> connectors;
  std::shared_ptr<action::NotificationSink>        notifier;
  std::shared_ptr<const util::ClockSource>         clock;
  trigger::TriggerSettings                         trigger_settings;

  std::string persona            = "default";
  int32_t     importance         = 8;
  std::string notification_title = "Routine";
};

/*
  Routine CRUD, trigger orchestration and execution bookkeeping.

  Every enabled routine owns exactly one trigger handle, unless its
  trigger cannot be installed. Mutations (create/update/delete/toggle
  and execution bookkeeping) are serialized on one mutex; executions of
  different routines run concurrently, a second execution of the same
  routine while one is in flight is dropped.
*/
class RoutineEngine {
 public:
  explicit RoutineEngine(EngineDependencies deps);
  ~RoutineEngine();

  RoutineEngine(const RoutineEngine&)            = delete;
  RoutineEngine& operator=(const RoutineEngine&) = delete;

  // Registers the trigger of every enabled routine in the store.
  void Start();

  // Deregisters every trigger and waits for ticks already running.
  void Shutdown();

  std::string CreateRoutine(const NewRoutine& routine);

  std::vector<manager::v1::RoutineSummary> GetRoutines(bool enabled_only) const;

  std::optional<manager::v1::Routine> GetRoutineById(const std::string& id) const;

  void UpdateRoutine(const std::string& id, const RoutinePatch& patch);

  void DeleteRoutine(const std::string& id);

  // Returns the new enabled state.
  bool ToggleRoutine(const std::string& id);

  // Never throws; failures land in execution.error.
  manager::v1::RoutineExecution ExecuteRoutine(const std::string& id, bool manual_trigger);

  // Runs every listener routine matching the event, ordered by id.
  std::vector<manager::v1::RoutineExecution> FireEvent(trigger::ListenerEvent event, const std::string& key);

  const trigger::TriggerManager& Triggers() const {
    return *triggers_;
  }

 private:
  std::optional<manager::v1::Routine> LoadRoutine(const std::string& id) const;

  void UpdateLocked(const std::string& id, const RoutinePatch& patch);
  void RecordExecution(const std::string& id);

  bool TryBeginExecution(const std::string& id);

  EngineDependencies                       deps_;
  ConditionEvaluator                       conditions_;
  action::ActionDispatcher                 actions_;
  std::unique_ptr<trigger::TriggerManager> triggers_;

  // Serializes store read-modify-write cycles and trigger (de)registration.
  mutable std::mutex mutation_mutex_;

  mutable std::mutex              in_flight_mutex_;
  std::unordered_set<std::string> in_flight_;
};

} // namespace routine::core
