#include "internal/core/routine_engine.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <google/protobuf/util/message_differencer.h>

#include "internal/core/routine_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace routine::core {

using namespace routine::manager::v1;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kSystemAuthor = "system";

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void ValidateRoutine(const Routine& routine) {
  if (IsBlank(routine.name())) {
    throw util::ValidationError("Routine name is required");
  }
  if (IsBlank(routine.description())) {
    throw util::ValidationError("Routine description is required");
  }
  if (routine.actions().empty()) {
    throw util::ValidationError("Routine requires at least one action");
  }
}

std::string NotFoundMessage(const std::string& id) {
  return "Routine with ID " + id + " not found";
}

bool SameTrigger(const Trigger& a, const Trigger& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

// Removes the id from the in-flight set on every exit path.
class InFlightRelease {
 public:
  InFlightRelease(std::mutex& mutex, std::unordered_set<std::string>& in_flight, std::string id)
      : mutex_(mutex), in_flight_(in_flight), id_(std::move(id)) {
  }

  ~InFlightRelease() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id_);
  }

 private:
  std::mutex&                      mutex_;
  std::unordered_set<std::string>& in_flight_;
  std::string                      id_;
};

} // namespace

RoutineEngine::RoutineEngine(EngineDependencies deps)
    : deps_(std::move(deps)), conditions_(deps_.clock, deps_.state_source),
      actions_(deps_.connectors, deps_.notifier, deps_.state_source, deps_.notification_title) {
  if (!deps_.store) {
    throw std::invalid_argument("RoutineEngine requires a record store");
  }
  if (!deps_.timers) {
    throw std::invalid_argument("RoutineEngine requires a timer factory");
  }
  if (!deps_.clock) {
    throw std::invalid_argument("RoutineEngine requires a clock source");
  }

  triggers_ = std::make_unique<trigger::TriggerManager>(
      deps_.timers, deps_.state_source, deps_.vision_source, [this](const std::string& id) { ExecuteRoutine(id, false); },
      deps_.trigger_settings);
}

RoutineEngine::~RoutineEngine() {
  try {
    Shutdown();
  } catch (const std::exception& e) {
    ROUTINE_LOG_ERROR("Routine engine shutdown failed", {StringField("error", e.what())});
  }
}

void RoutineEngine::Start() {
  std::lock_guard<std::mutex> lock(mutation_mutex_);

  std::size_t registered = 0;
  for (const auto& memory : deps_.store->GetRoutines(true)) {
    try {
      if (triggers_->Register(DecodeRoutine(memory))) {
        ++registered;
      }
    } catch (const std::exception& e) {
      ROUTINE_LOG_WARN("Skipping unreadable routine", {StringField("routine_id", memory.id), StringField("error", e.what())});
    }
  }

  ROUTINE_LOG_INFO("Routine engine started", {IntField("triggers", static_cast<int64_t>(registered))});
}

void RoutineEngine::Shutdown() {
  triggers_->DeregisterAll();
  // Cancelled ticks may still be executing; they must finish before the engine goes away.
  deps_.timers->JoinCancelled();
}

std::string RoutineEngine::CreateRoutine(const NewRoutine& request) {
  Routine routine;
  routine.set_name(request.name);
  routine.set_description(request.description);
  *routine.mutable_trigger()    = request.trigger;
  *routine.mutable_conditions() = request.conditions;
  *routine.mutable_actions()    = request.actions;
  for (const auto& tag : request.tags) {
    routine.add_tags(tag);
  }
  DedupeTags(routine.mutable_tags());
  routine.set_created_from_task(request.created_from_task);
  routine.set_enabled(true);
  *routine.mutable_created_at() = util::ToProto(deps_.clock->Now());

  ValidateRoutine(routine);

  std::lock_guard<std::mutex> lock(mutation_mutex_);
  const auto id = deps_.store->AddMemory(SummaryText(routine), kSystemAuthor, std::string(store::kRoutineKind), deps_.persona,
                                         deps_.importance, EncodeMetadata(routine));
  routine.set_id(id);

  ROUTINE_LOG_INFO("Created routine", {StringField("routine_id", id), StringField("name", routine.name()),
                                       StringField("trigger", DescribeTrigger(routine.trigger()))});

  triggers_->Register(routine);
  return id;
}

std::vector<RoutineSummary> RoutineEngine::GetRoutines(bool enabled_only) const {
  std::vector<RoutineSummary> summaries;
  for (const auto& memory : deps_.store->GetRoutines(enabled_only)) {
    summaries.push_back(Summarize(DecodeRoutine(memory)));
  }
  return summaries;
}

std::optional<Routine> RoutineEngine::GetRoutineById(const std::string& id) const {
  return LoadRoutine(id);
}

void RoutineEngine::UpdateRoutine(const std::string& id, const RoutinePatch& patch) {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  UpdateLocked(id, patch);
}

void RoutineEngine::DeleteRoutine(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutation_mutex_);

  if (!LoadRoutine(id)) {
    throw util::NotFound(NotFoundMessage(id));
  }

  triggers_->Deregister(id);
  if (!deps_.store->DeleteMemory(id)) {
    throw util::NotFound(NotFoundMessage(id));
  }

  ROUTINE_LOG_INFO("Deleted routine", {StringField("routine_id", id)});
}

bool RoutineEngine::ToggleRoutine(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutation_mutex_);

  const auto routine = LoadRoutine(id);
  if (!routine) {
    throw util::NotFound(NotFoundMessage(id));
  }

  RoutinePatch patch;
  patch.enabled = !routine->enabled();
  UpdateLocked(id, patch);
  return *patch.enabled;
}

RoutineExecution RoutineEngine::ExecuteRoutine(const std::string& id, bool manual_trigger) {
  RoutineExecution execution;
  execution.set_routine_id(id);
  execution.set_execution_id(util::NewId());
  *execution.mutable_start_time() = util::ToProto(deps_.clock->Now());

  if (!TryBeginExecution(id)) {
    ROUTINE_LOG_WARN("Dropping overlapping execution", {StringField("routine_id", id), BoolField("manual", manual_trigger)});
    execution.set_error("Routine " + id + " is already executing");
    *execution.mutable_end_time() = util::ToProto(deps_.clock->Now());
    return execution;
  }
  InFlightRelease release(in_flight_mutex_, in_flight_, id);

  try {
    const auto routine = LoadRoutine(id);
    if (!routine) {
      throw util::NotFound(NotFoundMessage(id));
    }
    if (!routine->enabled() && !manual_trigger) {
      throw util::DisabledRoutine("Routine " + id + " is disabled");
    }

    if (!manual_trigger && !conditions_.Evaluate(routine->conditions())) {
      ROUTINE_LOG_INFO("Routine conditions not met", {StringField("routine_id", id)});
      execution.set_error("Conditions not met");
    } else {
      ROUTINE_LOG_INFO("Executing routine",
                       {StringField("routine_id", id), StringField("name", routine->name()), BoolField("manual", manual_trigger)});
      for (auto& result : actions_.Run(routine->actions(), *routine)) {
        *execution.add_results() = std::move(result);
      }
      RecordExecution(id);
      execution.set_success(true);
    }
  } catch (const std::exception& e) {
    ROUTINE_LOG_WARN("Routine execution failed", {StringField("routine_id", id), StringField("error", e.what())});
    execution.set_error(e.what());
  }

  *execution.mutable_end_time() = util::ToProto(deps_.clock->Now());
  return execution;
}

std::vector<RoutineExecution> RoutineEngine::FireEvent(trigger::ListenerEvent event, const std::string& key) {
  auto ids = triggers_->MatchListeners(event, key);
  std::sort(ids.begin(), ids.end());

  std::vector<RoutineExecution> executions;
  executions.reserve(ids.size());
  for (const auto& id : ids) {
    executions.push_back(ExecuteRoutine(id, false));
  }
  return executions;
}

std::optional<Routine> RoutineEngine::LoadRoutine(const std::string& id) const {
  const auto memory = deps_.store->GetMemoryById(id);
  if (!memory || memory->kind != store::kRoutineKind) {
    return std::nullopt;
  }
  return DecodeRoutine(*memory);
}

void RoutineEngine::UpdateLocked(const std::string& id, const RoutinePatch& patch) {
  auto memory = deps_.store->GetMemoryById(id);
  if (!memory || memory->kind != store::kRoutineKind) {
    throw util::NotFound(NotFoundMessage(id));
  }

  const auto previous = DecodeRoutine(*memory);
  auto       routine  = previous;

  if (patch.name) {
    routine.set_name(*patch.name);
  }
  if (patch.description) {
    routine.set_description(*patch.description);
  }
  if (patch.enabled) {
    routine.set_enabled(*patch.enabled);
  }
  if (patch.trigger) {
    *routine.mutable_trigger() = *patch.trigger;
  }
  if (patch.conditions) {
    *routine.mutable_conditions() = *patch.conditions;
  }
  if (patch.actions) {
    *routine.mutable_actions() = *patch.actions;
  }
  if (patch.tags) {
    routine.clear_tags();
    for (const auto& tag : *patch.tags) {
      routine.add_tags(tag);
    }
    DedupeTags(routine.mutable_tags());
  }

  ValidateRoutine(routine);

  for (const auto& [key, value] : EncodeMetadata(routine).fields()) {
    (*memory->metadata.mutable_fields())[key] = value;
  }
  memory->text = SummaryText(routine);
  deps_.store->UpdateMemory(id, *memory);

  ROUTINE_LOG_INFO("Updated routine", {StringField("routine_id", id), BoolField("enabled", routine.enabled())});

  if (routine.enabled() != previous.enabled() || !SameTrigger(routine.trigger(), previous.trigger())) {
    triggers_->Deregister(id);
    if (routine.enabled()) {
      triggers_->Register(routine);
    }
  }
}

void RoutineEngine::RecordExecution(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutation_mutex_);

  auto memory = deps_.store->GetMemoryById(id);
  if (!memory || memory->kind != store::kRoutineKind) {
    ROUTINE_LOG_INFO("Routine removed during execution, skipping bookkeeping", {StringField("routine_id", id)});
    return;
  }

  MarkExecuted(&memory->metadata, deps_.clock->Now());
  deps_.store->UpdateMemory(id, *memory);
}

bool RoutineEngine::TryBeginExecution(const std::string& id) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.insert(id).second;
}

} // namespace routine::core
