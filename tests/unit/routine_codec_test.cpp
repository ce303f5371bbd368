#include "internal/core/routine_codec.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/message_differencer.h>

#include "internal/util/time.hpp"
#include "tests/support/fake_clock.hpp"

namespace {

namespace v1 = routine::manager::v1;
using google::protobuf::util::MessageDifferencer;
using routine::core::DecodeRoutine;
using routine::core::DescribeTrigger;
using routine::core::EncodeMetadata;
using routine::store::StoredMemory;

v1::Routine PorchLightRoutine() {
  v1::Routine routine;
  routine.set_id("routine-1");
  routine.set_name("Porch light");
  routine.set_description("Turn the porch light on when someone shows up at night");
  routine.set_enabled(true);
  routine.set_execution_count(3);
  routine.set_created_from_task("task-42");
  *routine.mutable_created_at()    = routine::util::ToProto(routine::testing::FakeClock::AtLocalHour(9));
  *routine.mutable_last_executed() = routine::util::ToProto(routine::testing::FakeClock::AtLocalHour(21));

  auto* vision = routine.mutable_trigger()->mutable_vision_detection();
  vision->set_service("frigate");
  vision->add_object_types("person");
  vision->set_min_confidence(0.7);
  vision->set_check_interval(5000);
  vision->set_camera("porch");
  vision->set_zone("driveway");

  auto* hours = routine.add_conditions()->mutable_time_range();
  hours->set_start_hour(18);
  hours->set_end_hour(23);

  auto* lux = routine.add_conditions()->mutable_comparison();
  lux->set_service("homeassistant");
  lux->set_entity("sensor.porch_lux");
  lux->set_op(v1::COMPARISON_OPERATOR_LT);
  lux->set_value(12.5);

  auto* light = routine.add_actions()->mutable_state_change();
  light->set_service("homeassistant");
  light->set_entity("light.porch");
  light->set_domain("light");
  light->set_operation("turn_on");
  (*light->mutable_data()->mutable_fields())["brightness"].set_number_value(200);

  routine.add_actions()->mutable_notification()->mutable_parameters()->set_message("Someone is at the porch");

  routine.add_tags("security");
  routine.add_tags("lights");
  return routine;
}

StoredMemory Wrap(const v1::Routine& routine) {
  StoredMemory memory;
  memory.id       = routine.id();
  memory.kind     = "routine";
  memory.metadata = EncodeMetadata(routine);
  return memory;
}

void TestRoutineSurvivesMetadataEncoding() {
  const auto routine = PorchLightRoutine();
  const auto decoded = DecodeRoutine(Wrap(routine));

  std::string diff;
  MessageDifferencer differencer;
  differencer.ReportDifferencesToString(&diff);
  const bool same = differencer.Compare(routine, decoded);
  if (!same) {
    std::cerr << diff << "\n";
  }
  assert(same);
}

void TestMetadataKeysAreNamedForTheStore() {
  const auto  metadata = EncodeMetadata(PorchLightRoutine());
  const auto& fields   = metadata.fields();

  assert(fields.at("routineName").string_value() == "Porch light");
  assert(fields.at("routineEnabled").bool_value());
  assert(fields.at("routineExecutionCount").number_value() == 3);
  assert(fields.at("routineTags").list_value().values_size() == 2);
  assert(fields.at("routineCreatedFromTask").string_value() == "task-42");
  assert(fields.at("routineActions").string_value().front() == '[');
  assert(fields.at("routineTrigger").string_value().find("visionDetection") != std::string::npos);

  v1::Routine fresh;
  fresh.set_name("fresh");
  const auto fresh_metadata = EncodeMetadata(fresh);
  assert(fresh_metadata.fields().at("lastExecuted").kind_case() == google::protobuf::Value::kNullValue);
  assert(fresh_metadata.fields().count("routineCreatedFromTask") == 0);
}

void TestMissingMetadataDecodesToDefaults() {
  StoredMemory memory;
  memory.id            = "bare";
  memory.kind          = "routine";
  memory.created_at_ms = 1'700'000'000'000ULL;

  const auto routine = DecodeRoutine(memory);
  assert(routine.name() == "Untitled Routine");
  assert(routine.enabled());
  assert(routine.execution_count() == 0);
  assert(routine.actions().empty());
  assert(routine.trigger().kind_case() == v1::Trigger::KIND_NOT_SET);
  assert(!routine.has_last_executed());
  assert(routine.created_at().seconds() == 1'700'000'000);
}

void TestCorruptPayloadThrows() {
  StoredMemory memory;
  memory.id = "corrupt";
  (*memory.metadata.mutable_fields())["routineActions"].set_string_value("{not json");

  bool threw = false;
  try {
    (void)DecodeRoutine(memory);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMarkExecutedBumpsCountOnly() {
  auto metadata = EncodeMetadata(PorchLightRoutine());
  const auto at = routine::testing::FakeClock::AtLocalHour(22);

  routine::core::MarkExecuted(&metadata, at);

  assert(metadata.fields().at("routineExecutionCount").number_value() == 4);
  assert(metadata.fields().at("lastExecuted").string_value() == routine::util::ToIso8601(at));
  assert(metadata.fields().at("routineName").string_value() == "Porch light");
}

void TestTimestampsKeepSubMillisecondPrecision() {
  const auto created = routine::testing::FakeClock::AtLocalHour(9) + std::chrono::microseconds(123'457);
  const auto last    = routine::testing::FakeClock::AtLocalHour(21) + std::chrono::nanoseconds(987'654'321);

  auto routine                     = PorchLightRoutine();
  *routine.mutable_created_at()    = routine::util::ToProto(created);
  *routine.mutable_last_executed() = routine::util::ToProto(last);

  const auto decoded = DecodeRoutine(Wrap(routine));
  assert(routine::util::FromProto(decoded.created_at()) == created);
  assert(routine::util::FromProto(decoded.last_executed()) == last);

  // millisecond strings from older records still decode
  const auto legacy = routine::util::FromIso8601("2024-01-31T07:05:00.250Z");
  assert(legacy.has_value());
  assert(routine::util::ToUnixMillis(*legacy) == 1'706'684'700'250ULL);
  assert(!routine::util::FromIso8601("yesterday").has_value());
}

void TestSummaryText() {
  auto routine = PorchLightRoutine();
  assert(routine::core::SummaryText(routine) ==
         "Porch light\n\nTurn the porch light on when someone shows up at night\n\n"
         "Trigger: Vision detection: frigate detecting person\nActions: 2 action(s)");

  v1::Trigger trigger;
  trigger.mutable_time()->set_schedule("every 15 minutes");
  assert(DescribeTrigger(trigger) == "Time-based: every 15 minutes");
  trigger.mutable_completion();
  assert(DescribeTrigger(trigger) == "Task completion: Any task");
  trigger.mutable_state_change()->mutable_monitor()->set_service("homeassistant");
  assert(DescribeTrigger(trigger) == "State change: homeassistant");
  assert(DescribeTrigger(v1::Trigger()) == "Unknown trigger");

  const auto summary = routine::core::Summarize(routine);
  assert(summary.id() == "routine-1");
  assert(summary.execution_count() == 3);
  assert(summary.tags_size() == 2);
  assert(summary.has_last_executed());
}

void TestDedupeTagsKeepsFirstOccurrence() {
  google::protobuf::RepeatedPtrField<std::string> tags;
  for (const auto* tag : {"morning", "home", "morning", "news", "home"}) {
    tags.Add()->assign(tag);
  }

  routine::core::DedupeTags(&tags);

  assert(tags.size() == 3);
  assert(tags.Get(0) == "morning");
  assert(tags.Get(1) == "home");
  assert(tags.Get(2) == "news");
}

} // namespace

int main() {
  TestRoutineSurvivesMetadataEncoding();
  TestMetadataKeysAreNamedForTheStore();
  TestMissingMetadataDecodesToDefaults();
  TestCorruptPayloadThrows();
  TestMarkExecutedBumpsCountOnly();
  TestTimestampsKeepSubMillisecondPrecision();
  TestSummaryText();
  TestDedupeTagsKeepsFirstOccurrence();

  std::cout << "routine_manager_unit_routine_codec: pass\n";
  return 0;
}
