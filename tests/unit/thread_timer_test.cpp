#include "internal/trigger/thread_timer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;
using routine::trigger::ThreadTimerFactory;

bool WaitFor(const std::function<bool()>& done, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

void TestTicksRepeatUntilCancelled() {
  std::atomic<int>   ticks{0};
  ThreadTimerFactory factory;

  auto timer = factory.Every(10ms, [&] { ++ticks; }, false);
  assert(WaitFor([&] { return ticks.load() >= 3; }));

  timer->Cancel();
  factory.JoinCancelled();

  const int after_cancel = ticks.load();
  std::this_thread::sleep_for(50ms);
  assert(ticks.load() == after_cancel);
}

void TestRunImmediatelyTicksBeforeTheFirstPeriod() {
  std::atomic<int>   ticks{0};
  ThreadTimerFactory factory;

  auto timer = factory.Every(1h, [&] { ++ticks; }, true);
  assert(WaitFor([&] { return ticks.load() == 1; }));

  // cancelling wakes the sleeping worker
  const auto started = std::chrono::steady_clock::now();
  timer.reset();
  factory.JoinCancelled();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(ticks.load() == 1);
}

void TestThrowingTickKeepsTheTimerAlive() {
  std::atomic<int>   ticks{0};
  ThreadTimerFactory factory;

  auto timer = factory.Every(5ms,
                             [&] {
                               ++ticks;
                               throw std::runtime_error("tick failed");
                             },
                             false);
  assert(WaitFor([&] { return ticks.load() >= 3; }));
}

void TestFactoryDestructionJoinsLiveTimers() {
  std::atomic<int> ticks{0};
  std::unique_ptr<routine::trigger::Timer> timer;
  {
    ThreadTimerFactory factory;
    timer = factory.Every(5ms, [&] { ++ticks; }, true);
    assert(WaitFor([&] { return ticks.load() >= 1; }));
  }
  const int after_destroy = ticks.load();
  std::this_thread::sleep_for(30ms);
  assert(ticks.load() == after_destroy);
}

void TestOversizedIntervalIsClampedInsteadOfSpinning() {
  std::atomic<int>   ticks{0};
  ThreadTimerFactory factory;

  auto timer = factory.Every(std::chrono::hours(3'000'000), [&] { ++ticks; }, false);
  std::this_thread::sleep_for(200ms);
  assert(ticks.load() == 0);

  timer->Cancel();
  factory.JoinCancelled();
  assert(ticks.load() == 0);
}

} // namespace

int main() {
  TestTicksRepeatUntilCancelled();
  TestRunImmediatelyTicksBeforeTheFirstPeriod();
  TestThrowingTickKeepsTheTimerAlive();
  TestFactoryDestructionJoinsLiveTimers();
  TestOversizedIntervalIsClampedInsteadOfSpinning();

  std::cout << "routine_manager_unit_thread_timer: pass\n";
  return 0;
}
