#include "internal/core/pattern_detector.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace routine::core {

namespace v1 = routine::manager::v1;
using google::protobuf::Struct;
using google::protobuf::Value;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kTaskTitle    = "taskTitle";
constexpr const char* kTaskStatus   = "taskStatus";
constexpr const char* kCompletedAt  = "completedAt";
constexpr const char* kTimestamp    = "timestamp";
constexpr const char* kCompleted    = "completed";
constexpr const char* kUnknownTitle = "Unknown";
constexpr const char* kAutoDetected = "auto-detected";

std::string GetString(const Struct& metadata, const char* key) {
  auto it = metadata.fields().find(std::string(key));
  if (it == metadata.fields().end() || it->second.kind_case() != Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

// Counts in first-seen order; ties go to the earliest key.
template <typename Key>
class OrderedCounter {
 public:
  void Add(const Key& key) {
    auto [it, inserted] = index_.emplace(key, counts_.size());
    if (inserted) {
      counts_.emplace_back(key, 1);
    } else {
      ++counts_[it->second].second;
    }
  }

  const std::vector<std::pair<Key, uint32_t>>& Entries() const {
    return counts_;
  }

 private:
  std::map<Key, std::size_t>            index_;
  std::vector<std::pair<Key, uint32_t>> counts_;
};

v1::Action NotificationAction(const std::string& message) {
  v1::Action action;
  action.mutable_notification()->mutable_parameters()->set_message(message);
  return action;
}

v1::RoutinePattern TemporalPattern(const std::string& title, int hour, uint32_t occurrences, double confidence) {
  const auto at = std::to_string(hour) + ":00";

  v1::RoutinePattern pattern;
  pattern.set_type(v1::PATTERN_TYPE_TEMPORAL);
  pattern.set_description("You often complete tasks like \"" + title + "\" around " + at +
                          ". Would you like to create a routine for this?");
  pattern.set_occurrences(occurrences);
  pattern.set_confidence(confidence);

  auto* routine = pattern.mutable_suggested_routine();
  routine->set_name("Daily " + title);
  routine->set_description("Automatically remind or create task \"" + title + "\" at " + at);
  routine->set_enabled(true);
  routine->mutable_trigger()->mutable_time()->set_schedule("every day at " + at);
  *routine->add_actions() = NotificationAction("Time for: " + title);
  routine->add_tags(kAutoDetected);
  routine->add_tags("temporal");
  return pattern;
}

v1::RoutinePattern SequentialPattern(const std::string& first, const std::string& next, uint32_t occurrences, double confidence) {
  v1::RoutinePattern pattern;
  pattern.set_type(v1::PATTERN_TYPE_SEQUENTIAL);
  pattern.set_description("You often complete tasks in this sequence: " + first + " → " + next +
                          ". Would you like to create a routine for this workflow?");
  pattern.set_occurrences(occurrences);
  pattern.set_confidence(confidence);

  auto* routine = pattern.mutable_suggested_routine();
  routine->set_name("Workflow: " + first + " → " + next);
  routine->set_description("Automated workflow for: " + first + ", " + next);
  routine->set_enabled(true);
  routine->mutable_trigger()->mutable_completion()->set_task_pattern(first);
  *routine->add_actions() = NotificationAction("Next step: " + next);
  routine->add_tags(kAutoDetected);
  routine->add_tags("sequential");
  return pattern;
}

} // namespace

PatternDetector::PatternDetector(std::shared_ptr<store::RecordStore> store, std::shared_ptr<trigger::TimerFactory> timers, PatternSettings settings)
    : store_(std::move(store)), timers_(std::move(timers)), settings_(settings) {
  if (!store_) {
    throw std::invalid_argument("PatternDetector requires a record store");
  }
  if (settings_.min_occurrences == 0) {
    throw std::invalid_argument("PatternDetector: min_occurrences must be positive");
  }
}

PatternDetector::~PatternDetector() {
  Stop();
}

void PatternDetector::Start() {
  if (!settings_.enabled) {
    ROUTINE_LOG_INFO("Pattern detection disabled");
    return;
  }
  if (!timers_) {
    throw std::logic_error("PatternDetector::Start requires a timer factory");
  }

  auto timer = timers_->Every(
      settings_.check_interval,
      [this] {
        try {
          (void)Detect();
        } catch (const std::exception& e) {
          ROUTINE_LOG_WARN("Pattern detection failed", {StringField("error", e.what())});
        }
      },
      false);

  std::lock_guard<std::mutex> lock(mutex_);
  timer_ = std::move(timer);
  ROUTINE_LOG_INFO("Pattern detection started", {IntField("interval_ms", settings_.check_interval.count())});
}

void PatternDetector::Stop() {
  std::unique_ptr<trigger::Timer> timer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timer = std::move(timer_);
  }
  if (timer) {
    timer->Cancel();
    // a tick already running still uses this detector
    timers_->JoinCancelled();
  }
}

std::vector<v1::RoutinePattern> PatternDetector::Detect() {
  const auto tasks = LoadCompletedTasks();

  auto patterns   = DetectTemporal(tasks);
  auto sequential = DetectSequential(tasks);
  patterns.insert(patterns.end(), std::make_move_iterator(sequential.begin()), std::make_move_iterator(sequential.end()));

  std::vector<v1::RoutinePattern> suggestions;
  for (const auto& pattern : patterns) {
    if (pattern.confidence() >= settings_.confidence_threshold) {
      ROUTINE_LOG_INFO("Routine pattern detected", {StringField("name", pattern.suggested_routine().name()),
                                                    IntField("occurrences", pattern.occurrences()), DoubleField("confidence", pattern.confidence())});
      suggestions.push_back(pattern);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    suggestions_ = std::move(suggestions);
  }

  ROUTINE_LOG_DEBUG("Pattern detection finished", {IntField("completed_tasks", static_cast<int64_t>(tasks.size())),
                                                   IntField("patterns", static_cast<int64_t>(patterns.size()))});
  return patterns;
}

std::vector<v1::RoutinePattern> PatternDetector::Suggestions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suggestions_;
}

std::vector<PatternDetector::CompletedTask> PatternDetector::LoadCompletedTasks() const {
  std::vector<CompletedTask> tasks;
  for (const auto& memory : store_->GetMemories(std::string(store::kTaskKind))) {
    if (GetString(memory.metadata, kTaskStatus) != kCompleted) {
      continue;
    }

    CompletedTask task;
    task.id    = memory.id;
    task.title = GetString(memory.metadata, kTaskTitle);
    if (task.title.empty()) {
      task.title = kUnknownTitle;
    }

    auto completed = util::FromIso8601(GetString(memory.metadata, kCompletedAt));
    if (!completed) {
      completed = util::FromIso8601(GetString(memory.metadata, kTimestamp));
    }
    // completing a task updates its record
    task.completed_at = completed ? *completed : util::TimePoint{} + std::chrono::milliseconds(memory.updated_at_ms);

    tasks.push_back(std::move(task));
  }

  std::stable_sort(tasks.begin(), tasks.end(), [](const CompletedTask& a, const CompletedTask& b) { return a.completed_at < b.completed_at; });
  return tasks;
}

std::vector<v1::RoutinePattern> PatternDetector::DetectTemporal(const std::vector<CompletedTask>& tasks) const {
  std::map<int, std::vector<const CompletedTask*>> by_hour;
  for (const auto& task : tasks) {
    by_hour[util::LocalHour(task.completed_at)].push_back(&task);
  }

  std::vector<v1::RoutinePattern> patterns;
  for (const auto& [hour, in_hour] : by_hour) {
    if (in_hour.size() < settings_.min_occurrences) {
      continue;
    }

    OrderedCounter<std::string> titles;
    for (const auto* task : in_hour) {
      titles.Add(task->title);
    }

    const std::pair<std::string, uint32_t>* common = nullptr;
    for (const auto& entry : titles.Entries()) {
      if (!common || entry.second > common->second) {
        common = &entry;
      }
    }
    if (!common || common->second < settings_.min_occurrences) {
      continue;
    }

    const double confidence = static_cast<double>(common->second) / static_cast<double>(in_hour.size());
    if (confidence >= settings_.confidence_threshold) {
      patterns.push_back(TemporalPattern(common->first, hour, common->second, confidence));
    }
  }
  return patterns;
}

std::vector<v1::RoutinePattern> PatternDetector::DetectSequential(const std::vector<CompletedTask>& tasks) const {
  OrderedCounter<std::pair<std::string, std::string>> pairs;
  for (std::size_t i = 0; i + 1 < tasks.size(); ++i) {
    pairs.Add({tasks[i].title, tasks[i + 1].title});
  }

  std::vector<v1::RoutinePattern> patterns;
  for (const auto& [pair, occurrences] : pairs.Entries()) {
    if (occurrences < settings_.min_occurrences) {
      continue;
    }
    const double confidence = static_cast<double>(occurrences) / static_cast<double>(tasks.size());
    if (confidence >= kSequentialConfidenceFloor) {
      patterns.push_back(SequentialPattern(pair.first, pair.second, occurrences, confidence));
    }
  }
  return patterns;
}

} // namespace routine::core
