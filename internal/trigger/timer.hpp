#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace routine::trigger {

// Longest period a timer accepts. Longer waits overflow the steady clock.
inline constexpr std::chrono::milliseconds kMaxTimerInterval = std::chrono::hours(24 * 366);

/*
  Handle to a periodic task. Destroying the handle cancels it.
*/
class Timer {
 public:
  virtual ~Timer() = default;

  // Stops future ticks. Does not wait for a tick already running.
  virtual void Cancel() = 0;
};

class TimerFactory {
 public:
  virtual ~TimerFactory() = default;

  // Calls tick every interval until cancelled; run_immediately adds a
  // first tick right away. interval is clamped to [1ms, kMaxTimerInterval].
  virtual std::unique_ptr<Timer> Every(std::chrono::milliseconds interval, std::function<void()> tick, bool run_immediately) = 0;

  // Blocks until every cancelled timer has finished its last tick.
  virtual void JoinCancelled() {
  }
};

} // namespace routine::trigger
