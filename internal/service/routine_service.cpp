#include "internal/service/routine_service.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/core/pattern_detector.hpp"
#include "internal/core/routine_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace routine::service {

using namespace routine::manager::v1;
using observability::DoubleField;
using observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view routine_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      ROUTINE_LOG_DEBUG("RPC completed", {StringField("route", route), StringField("routine_id", routine_id), DoubleField("latency_ms", ElapsedMs(started_at))});
      return;
    } else {
      auto result = fn();
      ROUTINE_LOG_DEBUG("RPC completed", {StringField("route", route), StringField("routine_id", routine_id), DoubleField("latency_ms", ElapsedMs(started_at))});
      return result;
    }
  } catch (const std::exception& ex) {
    ROUTINE_LOG_ERROR("RPC failed", {StringField("route", route), StringField("routine_id", routine_id), StringField("error", ex.what()),
                                     DoubleField("latency_ms", ElapsedMs(started_at))});
    throw;
  }
}

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::ValidationError("routine id is required");
  }
}

trigger::ListenerEvent ToListenerEvent(EventKind kind) {
  switch (kind) {
    case EVENT_KIND_EVENT:
      return trigger::ListenerEvent::kEvent;
    case EVENT_KIND_USER_ACTION:
      return trigger::ListenerEvent::kUserAction;
    case EVENT_KIND_TASK_COMPLETED:
      return trigger::ListenerEvent::kTaskCompleted;
    default:
      throw util::ValidationError("event kind is required");
  }
}

} // namespace

RoutineService::RoutineService(std::shared_ptr<routine::core::RoutineEngine> engine, std::shared_ptr<routine::core::PatternDetector> patterns)
    : engine_(std::move(engine)), patterns_(std::move(patterns)) {
}

CreateRoutineResponse RoutineService::CreateRoutine(const CreateRoutineRequest& req) {
  return ObserveRpc("RoutineService.CreateRoutine", "", [&] {
    core::NewRoutine routine;
    routine.name              = req.name();
    routine.description       = req.description();
    routine.trigger           = req.trigger();
    routine.conditions        = req.conditions();
    routine.actions           = req.actions();
    routine.tags.assign(req.tags().begin(), req.tags().end());
    routine.created_from_task = req.created_from_task();

    CreateRoutineResponse resp;
    resp.set_id(engine_->CreateRoutine(routine));
    return resp;
  });
}

ListRoutinesResponse RoutineService::ListRoutines(const ListRoutinesRequest& req) {
  return ObserveRpc("RoutineService.ListRoutines", "", [&] {
    ListRoutinesResponse resp;
    for (auto& summary : engine_->GetRoutines(req.enabled_only())) {
      *resp.add_routines() = std::move(summary);
    }
    return resp;
  });
}

GetRoutineResponse RoutineService::GetRoutine(const GetRoutineRequest& req) {
  return ObserveRpc("RoutineService.GetRoutine", req.id(), [&] {
    RequireId(req.id());
    auto routine = engine_->GetRoutineById(req.id());
    if (!routine) {
      throw util::NotFound("Routine with ID " + req.id() + " not found");
    }

    GetRoutineResponse resp;
    *resp.mutable_routine() = std::move(*routine);
    return resp;
  });
}

void RoutineService::UpdateRoutine(const UpdateRoutineRequest& req) {
  ObserveRpc("RoutineService.UpdateRoutine", req.id(), [&] {
    RequireId(req.id());

    core::RoutinePatch patch;
    if (req.has_name()) {
      patch.name = req.name();
    }
    if (req.has_description()) {
      patch.description = req.description();
    }
    if (req.has_enabled()) {
      patch.enabled = req.enabled();
    }
    if (req.has_trigger()) {
      patch.trigger = req.trigger();
    }
    if (req.has_conditions()) {
      patch.conditions = req.conditions().conditions();
    }
    if (req.has_actions()) {
      patch.actions = req.actions().actions();
    }
    if (req.has_tags()) {
      patch.tags = std::vector<std::string>(req.tags().tags().begin(), req.tags().tags().end());
    }

    engine_->UpdateRoutine(req.id(), patch);
  });
}

void RoutineService::DeleteRoutine(const DeleteRoutineRequest& req) {
  ObserveRpc("RoutineService.DeleteRoutine", req.id(), [&] {
    RequireId(req.id());
    engine_->DeleteRoutine(req.id());
  });
}

ToggleRoutineResponse RoutineService::ToggleRoutine(const ToggleRoutineRequest& req) {
  return ObserveRpc("RoutineService.ToggleRoutine", req.id(), [&] {
    RequireId(req.id());
    ToggleRoutineResponse resp;
    resp.set_enabled(engine_->ToggleRoutine(req.id()));
    return resp;
  });
}

ExecuteRoutineResponse RoutineService::ExecuteRoutine(const ExecuteRoutineRequest& req) {
  return ObserveRpc("RoutineService.ExecuteRoutine", req.id(), [&] {
    RequireId(req.id());
    ExecuteRoutineResponse resp;
    *resp.mutable_execution() = engine_->ExecuteRoutine(req.id(), req.manual_trigger());
    return resp;
  });
}

FireEventResponse RoutineService::FireEvent(const FireEventRequest& req) {
  return ObserveRpc("RoutineService.FireEvent", "", [&] {
    const auto event = ToListenerEvent(req.kind());

    FireEventResponse resp;
    for (auto& execution : engine_->FireEvent(event, req.key())) {
      *resp.add_executions() = std::move(execution);
    }
    return resp;
  });
}

DetectPatternsResponse RoutineService::DetectPatterns(const DetectPatternsRequest&) {
  return ObserveRpc("RoutineService.DetectPatterns", "", [&] {
    DetectPatternsResponse resp;
    for (auto& pattern : Patterns().Detect()) {
      *resp.add_patterns() = std::move(pattern);
    }
    return resp;
  });
}

ListPatternSuggestionsResponse RoutineService::ListPatternSuggestions(const ListPatternSuggestionsRequest&) {
  return ObserveRpc("RoutineService.ListPatternSuggestions", "", [&] {
    ListPatternSuggestionsResponse resp;
    for (auto& pattern : Patterns().Suggestions()) {
      *resp.add_suggestions() = std::move(pattern);
    }
    return resp;
  });
}

core::PatternDetector& RoutineService::Patterns() const {
  if (!patterns_) {
    throw util::Unsupported("pattern detection is not available");
  }
  return *patterns_;
}

} // namespace routine::service
