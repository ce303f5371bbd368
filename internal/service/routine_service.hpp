#pragma once

#include <memory>

#include "routine/manager/v1.hpp"

namespace routine::core {
class PatternDetector;
class RoutineEngine;
}

namespace routine::service {

/*
  Request/response translation for RoutineAutomationService.

  Errors propagate as util exceptions; the gRPC adapter maps them.
*/
class RoutineService {
 public:
  // patterns may be null; the pattern RPCs then fail with Unsupported.
  RoutineService(std::shared_ptr<routine::core::RoutineEngine> engine, std::shared_ptr<routine::core::PatternDetector> patterns = nullptr);

  routine::manager::v1::CreateRoutineResponse CreateRoutine(const routine::manager::v1::CreateRoutineRequest& req);

  routine::manager::v1::ListRoutinesResponse ListRoutines(const routine::manager::v1::ListRoutinesRequest& req);

  routine::manager::v1::GetRoutineResponse GetRoutine(const routine::manager::v1::GetRoutineRequest& req);

  void UpdateRoutine(const routine::manager::v1::UpdateRoutineRequest& req);

  void DeleteRoutine(const routine::manager::v1::DeleteRoutineRequest& req);

  routine::manager::v1::ToggleRoutineResponse ToggleRoutine(const routine::manager::v1::ToggleRoutineRequest& req);

  routine::manager::v1::ExecuteRoutineResponse ExecuteRoutine(const routine::manager::v1::ExecuteRoutineRequest& req);

  routine::manager::v1::FireEventResponse FireEvent(const routine::manager::v1::FireEventRequest& req);

  routine::manager::v1::DetectPatternsResponse DetectPatterns(const routine::manager::v1::DetectPatternsRequest& req);

  routine::manager::v1::ListPatternSuggestionsResponse ListPatternSuggestions(const routine::manager::v1::ListPatternSuggestionsRequest& req);

 private:
  routine::core::PatternDetector& Patterns() const;

  std::shared_ptr<routine::core::RoutineEngine>   engine_;
  std::shared_ptr<routine::core::PatternDetector> patterns_;
};

} // namespace routine::service
