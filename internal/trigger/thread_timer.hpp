#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/trigger/timer.hpp"

namespace routine::trigger {

/*
  One thread per timer.

  Cancelled timers finish on their own; their threads are reaped on the
  next Every()/JoinCancelled() call and joined when the factory is
  destroyed.
*/
class ThreadTimerFactory final : public TimerFactory {
 public:
  ThreadTimerFactory() = default;
  ~ThreadTimerFactory() override;

  ThreadTimerFactory(const ThreadTimerFactory&)            = delete;
  ThreadTimerFactory& operator=(const ThreadTimerFactory&) = delete;

  std::unique_ptr<Timer> Every(std::chrono::milliseconds interval, std::function<void()> tick, bool run_immediately) override;

  void JoinCancelled() override;

  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
    bool                    finished  = false;
  };

 private:
  struct Worker {
    std::shared_ptr<State> state;
    std::thread            thread;
  };

  static void Loop(const std::shared_ptr<State>& state, std::chrono::milliseconds interval, const std::function<void()>& tick, bool run_immediately);

  enum class Select { kFinished, kCancelled, kAll };

  std::vector<Worker> TakeWorkers(Select select);

  std::mutex          mutex_;
  std::vector<Worker> workers_;
};

} // namespace routine::trigger
