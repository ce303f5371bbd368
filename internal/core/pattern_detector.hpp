#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/store/record_store.hpp"
#include "internal/trigger/timer.hpp"
#include "internal/util/time.hpp"
#include "routine/manager/v1.hpp"

namespace routine::core {

struct PatternSettings {
  bool                      enabled              = true;
  uint32_t                  min_occurrences      = 3;
  double                    confidence_threshold = 0.7;
  std::chrono::milliseconds check_interval       = std::chrono::hours(1);
};

// Sequential patterns below this share of all completed tasks are dropped.
inline constexpr double kSequentialConfidenceFloor = 0.3;

/*
  Suggests routines from completed task records (kind "task").

  Temporal: completed tasks are grouped by local hour of completion. An
  hour with at least min_occurrences tasks whose most common title holds
  at least min_occurrences of them and a share >= confidence_threshold
  yields a daily time-triggered reminder.

  Sequential: completed tasks ordered by completion time are scanned in
  adjacent pairs. A pair seen at least min_occurrences times whose count
  over all completed tasks is >= kSequentialConfidenceFloor yields a
  completion-triggered workflow.

  Detect() returns every pattern; Suggestions() keeps those of the latest
  run at or above confidence_threshold.
*/
class PatternDetector {
 public:
  PatternDetector(std::shared_ptr<store::RecordStore> store, std::shared_ptr<trigger::TimerFactory> timers, PatternSettings settings);
  ~PatternDetector();

  PatternDetector(const PatternDetector&)            = delete;
  PatternDetector& operator=(const PatternDetector&) = delete;

  // Schedules Detect() every check_interval. No-op when disabled.
  void Start();
  void Stop();

  std::vector<manager::v1::RoutinePattern> Detect();

  std::vector<manager::v1::RoutinePattern> Suggestions() const;

  const PatternSettings& Settings() const {
    return settings_;
  }

 private:
  struct CompletedTask {
    std::string     id;
    std::string     title;
    util::TimePoint completed_at;
  };

  std::vector<CompletedTask> LoadCompletedTasks() const;

  std::vector<manager::v1::RoutinePattern> DetectTemporal(const std::vector<CompletedTask>& tasks) const;
  std::vector<manager::v1::RoutinePattern> DetectSequential(const std::vector<CompletedTask>& tasks) const;

  std::shared_ptr<store::RecordStore>    store_;
  std::shared_ptr<trigger::TimerFactory> timers_;
  PatternSettings                        settings_;

  mutable std::mutex                       mutex_;
  std::unique_ptr<trigger::Timer>          timer_;
  std::vector<manager::v1::RoutinePattern> suggestions_;
};

} // namespace routine::core
