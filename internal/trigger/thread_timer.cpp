#include "internal/trigger/thread_timer.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace routine::trigger {
namespace {

class ThreadTimer final : public Timer {
 public:
  explicit ThreadTimer(std::shared_ptr<ThreadTimerFactory::State> state) : state_(std::move(state)) {
  }

  ~ThreadTimer() override {
    Cancel();
  }

  void Cancel() override {
    {
      std::scoped_lock lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

 private:
  std::shared_ptr<ThreadTimerFactory::State> state_;
};

void RunTick(const std::function<void()>& tick) {
  try {
    tick();
  } catch (const std::exception& e) {
    ROUTINE_LOG_ERROR("Timer tick failed", {observability::StringField("error", e.what())});
  }
}

bool IsCancelled(ThreadTimerFactory::State& state) {
  std::scoped_lock lock(state.mutex);
  return state.cancelled;
}

} // namespace

ThreadTimerFactory::~ThreadTimerFactory() {
  auto workers = TakeWorkers(Select::kAll);
  for (auto& worker : workers) {
    {
      std::scoped_lock lock(worker.state->mutex);
      worker.state->cancelled = true;
    }
    worker.state->cv.notify_all();
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

std::unique_ptr<Timer> ThreadTimerFactory::Every(std::chrono::milliseconds interval, std::function<void()> tick, bool run_immediately) {
  for (auto& worker : TakeWorkers(Select::kFinished)) {
    if (worker.thread.joinable()) worker.thread.join();
  }

  if (interval > kMaxTimerInterval) {
    ROUTINE_LOG_WARN("Timer interval clamped", {observability::IntField("requested_ms", interval.count()),
                                                observability::IntField("interval_ms", kMaxTimerInterval.count())});
    interval = kMaxTimerInterval;
  }
  interval = std::max(interval, std::chrono::milliseconds(1));

  auto state = std::make_shared<State>();

  Worker worker;
  worker.state  = state;
  worker.thread = std::thread(&ThreadTimerFactory::Loop, state, interval, std::move(tick), run_immediately);

  {
    std::scoped_lock lock(mutex_);
    workers_.push_back(std::move(worker));
  }

  return std::make_unique<ThreadTimer>(std::move(state));
}

void ThreadTimerFactory::JoinCancelled() {
  for (auto& worker : TakeWorkers(Select::kCancelled)) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

void ThreadTimerFactory::Loop(const std::shared_ptr<State>& state, std::chrono::milliseconds interval, const std::function<void()>& tick,
                              bool run_immediately) {
  if (run_immediately && !IsCancelled(*state)) {
    RunTick(tick);
  }

  while (true) {
    {
      std::unique_lock lock(state->mutex);
      if (state->cv.wait_for(lock, interval, [&] { return state->cancelled; })) {
        break;
      }
    }
    RunTick(tick);
  }

  std::scoped_lock lock(state->mutex);
  state->finished = true;
}

std::vector<ThreadTimerFactory::Worker> ThreadTimerFactory::TakeWorkers(Select select) {
  std::scoped_lock    lock(mutex_);
  std::vector<Worker> taken;
  std::vector<Worker> kept;
  for (auto& worker : workers_) {
    bool take = true;
    if (select != Select::kAll) {
      std::scoped_lock state_lock(worker.state->mutex);
      take = select == Select::kFinished ? worker.state->finished : worker.state->cancelled;
    }
    (take ? taken : kept).push_back(std::move(worker));
  }
  workers_ = std::move(kept);
  return taken;
}

} // namespace routine::trigger
