#include "internal/trigger/trigger_manager.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tests/support/fake_sources.hpp"
#include "tests/support/manual_timer_factory.hpp"

namespace {

namespace v1 = routine::manager::v1;
using routine::testing::FakeStateSource;
using routine::testing::FakeVisionSource;
using routine::testing::ManualTimerFactory;
using routine::testing::StringValue;
using routine::trigger::Detection;
using routine::trigger::ListenerEvent;
using routine::trigger::TriggerKind;
using routine::trigger::TriggerManager;

class FireLog {
 public:
  void Record(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    fired_.push_back(id);
  }

  std::vector<std::string> Fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> fired_;
};

struct Fixture {
  std::shared_ptr<ManualTimerFactory> timers = std::make_shared<ManualTimerFactory>();
  std::shared_ptr<FakeStateSource>    state  = std::make_shared<FakeStateSource>();
  std::shared_ptr<FakeVisionSource>   vision = std::make_shared<FakeVisionSource>();
  std::shared_ptr<FireLog>            log    = std::make_shared<FireLog>();
  TriggerManager                      manager{timers, state, vision, [log = log](const std::string& id) { log->Record(id); }};
};

v1::Routine WithSchedule(const std::string& id, const std::string& schedule) {
  v1::Routine routine;
  routine.set_id(id);
  routine.set_name(id);
  routine.mutable_trigger()->mutable_time()->set_schedule(schedule);
  return routine;
}

v1::Routine WatchingEntity(const std::string& id, const std::string& entity, const std::string& property = "") {
  v1::Routine routine;
  routine.set_id(id);
  auto* monitor = routine.mutable_trigger()->mutable_state_change()->mutable_monitor();
  monitor->set_service("homeassistant");
  monitor->set_entity(entity);
  monitor->set_property(property);
  return routine;
}

v1::Routine WatchingCamera(const std::string& id, std::initializer_list<const char*> types) {
  v1::Routine routine;
  routine.set_id(id);
  auto* vision = routine.mutable_trigger()->mutable_vision_detection();
  vision->set_service("frigate");
  vision->set_camera("driveway");
  for (const auto* type : types) {
    vision->add_object_types(type);
  }
  return routine;
}

void TestTimeTriggerInstallsOnePeriodicTimer() {
  Fixture fixture;
  assert(fixture.manager.Register(WithSchedule("r1", "every 15 minutes")));

  assert(fixture.manager.HasTrigger("r1"));
  assert(fixture.manager.KindOf("r1") == TriggerKind::kTime);

  const auto active = fixture.timers->Active();
  assert(active.size() == 1);
  assert(active[0].interval == std::chrono::milliseconds(900'000));
  assert(!active[0].run_immediately);

  fixture.timers->TickAll();
  fixture.timers->TickAll();
  assert((fixture.log->Fired() == std::vector<std::string>{"r1", "r1"}));
}

void TestInvalidConfigurationsInstallNothing() {
  Fixture fixture;
  assert(!fixture.manager.Register(WithSchedule("bad-schedule", "gibberish")));
  assert(!fixture.manager.Register(WithSchedule("no-schedule", "")));
  assert(!fixture.manager.Register(WatchingEntity("no-entity", "")));

  auto other_provider = WatchingEntity("other", "light.kitchen");
  other_provider.mutable_trigger()->mutable_state_change()->mutable_monitor()->set_service("smartthings");
  assert(!fixture.manager.Register(other_provider));

  assert(!fixture.manager.Register(WatchingCamera("no-types", {})));

  auto unknown_vision = WatchingCamera("unknown-vision", {"person"});
  unknown_vision.mutable_trigger()->mutable_vision_detection()->set_service("rekognition");
  assert(!fixture.manager.Register(unknown_vision));

  v1::Routine unset;
  unset.set_id("unset");
  assert(!fixture.manager.Register(unset));

  assert(fixture.manager.ActiveCount() == 0);
  assert(fixture.timers->CreatedCount() == 0);
}

void TestReRegisterReplacesHandle() {
  Fixture fixture;
  fixture.manager.Register(WithSchedule("r1", "every hour"));
  fixture.manager.Register(WithSchedule("r1", "daily"));

  assert(fixture.manager.ActiveCount() == 1);
  const auto active = fixture.timers->Active();
  assert(active.size() == 1);
  assert(active[0].interval == std::chrono::milliseconds(86'400'000));

  // an invalid replacement drops the old handle
  assert(!fixture.manager.Register(WithSchedule("r1", "gibberish")));
  assert(!fixture.manager.HasTrigger("r1"));
  assert(fixture.timers->ActiveCount() == 0);
}

void TestDeregisterIsIdempotentAndStopsTicks() {
  Fixture fixture;
  fixture.manager.Register(WithSchedule("r1", "every hour"));
  fixture.manager.Register(WithSchedule("r2", "every hour"));

  fixture.manager.Deregister("r1");
  fixture.manager.Deregister("r1");
  fixture.manager.Deregister("never-registered");

  assert(fixture.manager.ActiveCount() == 1);
  fixture.timers->TickAll();
  assert((fixture.log->Fired() == std::vector<std::string>{"r2"}));

  fixture.manager.DeregisterAll();
  assert(fixture.manager.ActiveCount() == 0);
  assert(fixture.timers->ActiveCount() == 0);
}

void TestStatePollRecordsBaselineThenFiresOncePerChange() {
  Fixture fixture;
  fixture.state->SetState("binary_sensor.door", StringValue("off"));
  assert(fixture.manager.Register(WatchingEntity("door", "binary_sensor.door")));

  const auto active = fixture.timers->Active();
  assert(active.size() == 1);
  assert(active[0].interval == std::chrono::milliseconds(30'000));
  assert(active[0].run_immediately);

  fixture.timers->TickAll();
  assert(fixture.log->Fired().empty());

  fixture.timers->TickAll();
  assert(fixture.log->Fired().empty());

  fixture.state->SetState("binary_sensor.door", StringValue("on"));
  fixture.timers->TickAll();
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 1);

  fixture.state->SetState("binary_sensor.door", StringValue("off"));
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 2);
}

void TestStatePollWatchesAttribute() {
  Fixture fixture;
  fixture.state->SetState("light.kitchen", StringValue("on"));
  fixture.state->SetAttribute("light.kitchen", "brightness", routine::testing::NumberValue(100));
  fixture.manager.Register(WatchingEntity("dim", "light.kitchen", "brightness"));

  fixture.timers->TickAll();
  fixture.state->SetState("light.kitchen", StringValue("off"), fixture.state->GetState("light.kitchen").attributes);
  fixture.timers->TickAll();
  assert(fixture.log->Fired().empty());

  fixture.state->SetAttribute("light.kitchen", "brightness", routine::testing::NumberValue(20));
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 1);
}

void TestPollErrorsKeepTheHandle() {
  Fixture fixture;
  fixture.state->SetFailing(true);
  fixture.manager.Register(WatchingEntity("door", "binary_sensor.door"));

  fixture.timers->TickAll();
  fixture.timers->TickAll();
  assert(fixture.manager.HasTrigger("door"));
  assert(fixture.log->Fired().empty());

  // the first successful poll is still only a baseline
  fixture.state->SetFailing(false);
  fixture.state->SetState("binary_sensor.door", StringValue("on"));
  fixture.timers->TickAll();
  assert(fixture.log->Fired().empty());
}

void TestVisionPollDebouncesBySignature() {
  Fixture fixture;
  assert(fixture.manager.Register(WatchingCamera("cam", {"person", "car"})));

  const auto active = fixture.timers->Active();
  assert(active.size() == 1);
  assert(active[0].interval == std::chrono::milliseconds(10'000));
  assert(active[0].run_immediately);

  fixture.vision->SetDetections({{"person", 0.9}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 1);

  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 1);

  fixture.vision->SetDetections({{"car", 0.8}, {"person", 0.9}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 2);

  // nothing matched resets the signature without firing
  fixture.vision->SetDetections({{"dog", 0.99}, {"person", 0.2}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 2);

  fixture.vision->SetDetections({{"person", 0.9}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 3);
  assert(fixture.vision->LastService() == "frigate");
}

void TestVisionPollHonoursIntervalAndConfidence() {
  Fixture fixture;
  auto    routine = WatchingCamera("cam", {"person"});
  routine.mutable_trigger()->mutable_vision_detection()->set_check_interval(2500);
  routine.mutable_trigger()->mutable_vision_detection()->set_min_confidence(0.95);
  fixture.manager.Register(routine);

  assert(fixture.timers->Active()[0].interval == std::chrono::milliseconds(2500));

  fixture.vision->SetDetections({{"person", 0.9}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().empty());

  fixture.vision->SetDetections({{"person", 0.96}});
  fixture.timers->TickAll();
  assert(fixture.log->Fired().size() == 1);
}

void TestListenersMatchEvents() {
  Fixture fixture;

  v1::Routine on_event;
  on_event.set_id("on-event");
  on_event.mutable_trigger()->mutable_event()->set_event_name("arrived_home");

  v1::Routine on_action;
  on_action.set_id("on-action");
  on_action.mutable_trigger()->mutable_user_action()->set_action_type("opened_app");

  v1::Routine on_report;
  on_report.set_id("on-report");
  on_report.mutable_trigger()->mutable_completion()->set_task_pattern("Report");

  v1::Routine on_any_task;
  on_any_task.set_id("on-any-task");
  on_any_task.mutable_trigger()->mutable_completion();

  for (const auto* routine : {&on_event, &on_action, &on_report, &on_any_task}) {
    assert(fixture.manager.Register(*routine));
    assert(fixture.manager.KindOf(routine->id()) == TriggerKind::kListener);
  }
  assert(fixture.timers->CreatedCount() == 0);

  assert((fixture.manager.MatchListeners(ListenerEvent::kEvent, "arrived_home") == std::vector<std::string>{"on-event"}));
  assert(fixture.manager.MatchListeners(ListenerEvent::kEvent, "left_home").empty());
  assert((fixture.manager.MatchListeners(ListenerEvent::kUserAction, "opened_app") == std::vector<std::string>{"on-action"}));

  auto tasks = fixture.manager.MatchListeners(ListenerEvent::kTaskCompleted, "weekly report draft");
  std::sort(tasks.begin(), tasks.end());
  assert((tasks == std::vector<std::string>{"on-any-task", "on-report"}));

  assert((fixture.manager.MatchListeners(ListenerEvent::kTaskCompleted, "groceries") == std::vector<std::string>{"on-any-task"}));
}

} // namespace

int main() {
  TestTimeTriggerInstallsOnePeriodicTimer();
  TestInvalidConfigurationsInstallNothing();
  TestReRegisterReplacesHandle();
  TestDeregisterIsIdempotentAndStopsTicks();
  TestStatePollRecordsBaselineThenFiresOncePerChange();
  TestStatePollWatchesAttribute();
  TestPollErrorsKeepTheHandle();
  TestVisionPollDebouncesBySignature();
  TestVisionPollHonoursIntervalAndConfidence();
  TestListenersMatchEvents();

  std::cout << "routine_manager_unit_trigger_manager: pass\n";
  return 0;
}
