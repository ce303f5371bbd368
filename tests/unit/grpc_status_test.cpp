#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/action/connector_registry.hpp"
#include "internal/core/pattern_detector.hpp"
#include "internal/core/routine_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/routine_server.hpp"
#include "internal/service/routine_service.hpp"
#include "internal/store/repository_record_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "routine/manager/v1.hpp"
#include "tests/support/fake_clock.hpp"
#include "tests/support/fake_sources.hpp"
#include "tests/support/manual_timer_factory.hpp"

namespace {

namespace v1 = routine::manager::v1;

struct Harness {
  std::shared_ptr<routine::core::RoutineEngine> engine;
  std::unique_ptr<routine::grpc::RoutineServer> server;
};

Harness BuildServer() {
  auto clock = std::make_shared<routine::testing::FakeClock>();

  routine::core::EngineDependencies deps;
  deps.store         = std::make_shared<routine::store::RepositoryRecordStore>(std::make_shared<routine::db::memory::MemoryRepository>(), clock);
  deps.timers        = std::make_shared<routine::testing::ManualTimerFactory>();
  deps.state_source  = std::make_shared<routine::testing::FakeStateSource>();
  deps.vision_source = std::make_shared<routine::testing::FakeVisionSource>();
  deps.connectors    = std::make_shared<routine::action::ConnectorRegistry>();
  deps.notifier      = std::make_shared<routine::testing::RecordingNotificationSink>();
  deps.clock         = clock;

  Harness harness;
  harness.engine = std::make_shared<routine::core::RoutineEngine>(std::move(deps));
  harness.server = std::make_unique<routine::grpc::RoutineServer>(std::make_shared<routine::service::RoutineService>(harness.engine));
  return harness;
}

v1::CreateRoutineRequest ValidCreate() {
  v1::CreateRoutineRequest req;
  req.set_name("Night mode");
  req.set_description("dim everything at night");
  req.mutable_trigger()->mutable_event()->set_event_name("bedtime");
  req.add_actions()->mutable_notification();
  return req;
}

std::string Create(Harness& harness) {
  auto                      req = ValidCreate();
  v1::CreateRoutineResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = harness.server->CreateRoutine(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.id().empty());
  return resp.id();
}

void TestCreateWithoutActionsReturnsInvalidArgument() {
  auto harness = BuildServer();

  auto req = ValidCreate();
  req.clear_actions();
  v1::CreateRoutineResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = harness.server->CreateRoutine(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "Routine requires at least one action");
}

void TestGetMissingRoutineReturnsNotFound() {
  auto harness = BuildServer();

  v1::GetRoutineRequest  req;
  v1::GetRoutineResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  auto status = harness.server->GetRoutine(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_id("missing-routine");
  status = harness.server->GetRoutine(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_id(Create(harness));
  status = harness.server->GetRoutine(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.routine().name() == "Night mode");
  assert(resp.routine().trigger().event().event_name() == "bedtime");
}

void TestUpdateAndDeleteMissingRoutineReturnNotFound() {
  auto harness = BuildServer();

  v1::UpdateRoutineRequest update;
  update.set_id("missing-routine");
  update.set_name("renamed");
  google::protobuf::Empty empty;
  ::grpc::ServerContext   grpc_ctx;
  assert(harness.server->UpdateRoutine(&grpc_ctx, &update, &empty).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::DeleteRoutineRequest remove;
  remove.set_id(Create(harness));
  assert(harness.server->DeleteRoutine(&grpc_ctx, &remove, &empty).ok());
  assert(harness.server->DeleteRoutine(&grpc_ctx, &remove, &empty).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::ToggleRoutineRequest  toggle;
  v1::ToggleRoutineResponse toggled;
  toggle.set_id(remove.id());
  assert(harness.server->ToggleRoutine(&grpc_ctx, &toggle, &toggled).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestUpdateClearingActionsReturnsInvalidArgument() {
  auto harness = BuildServer();

  v1::UpdateRoutineRequest update;
  update.set_id(Create(harness));
  update.mutable_actions();
  google::protobuf::Empty empty;
  ::grpc::ServerContext   grpc_ctx;

  assert(harness.server->UpdateRoutine(&grpc_ctx, &update, &empty).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestExecutionFailuresAreReportedInline() {
  auto harness = BuildServer();
  const auto id = Create(harness);

  ::grpc::ServerContext     grpc_ctx;
  v1::ToggleRoutineRequest  toggle;
  v1::ToggleRoutineResponse toggled;
  toggle.set_id(id);
  assert(harness.server->ToggleRoutine(&grpc_ctx, &toggle, &toggled).ok());
  assert(!toggled.enabled());

  v1::ExecuteRoutineRequest  req;
  v1::ExecuteRoutineResponse resp;
  req.set_id(id);
  const auto status = harness.server->ExecuteRoutine(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.execution().success());
  assert(resp.execution().error() == "Routine " + id + " is disabled");

  req.set_manual_trigger(true);
  assert(harness.server->ExecuteRoutine(&grpc_ctx, &req, &resp).ok());
  assert(resp.execution().success());
}

void TestFireEventRequiresKind() {
  auto harness = BuildServer();
  Create(harness);

  v1::FireEventRequest  req;
  v1::FireEventResponse resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_key("bedtime");

  assert(harness.server->FireEvent(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_kind(v1::EVENT_KIND_EVENT);
  assert(harness.server->FireEvent(&grpc_ctx, &req, &resp).ok());
  assert(resp.executions_size() == 1);
  assert(resp.executions(0).success());
}

void TestPatternRpcsWithoutDetectorAreUnimplemented() {
  auto harness = BuildServer();

  v1::DetectPatternsRequest  detect_req;
  v1::DetectPatternsResponse detect_resp;
  ::grpc::ServerContext      detect_ctx;
  assert(harness.server->DetectPatterns(&detect_ctx, &detect_req, &detect_resp).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);

  v1::ListPatternSuggestionsRequest  list_req;
  v1::ListPatternSuggestionsResponse list_resp;
  ::grpc::ServerContext              list_ctx;
  assert(harness.server->ListPatternSuggestions(&list_ctx, &list_req, &list_resp).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
}

void TestPatternRpcsReportDetectedHabits() {
  auto clock  = std::make_shared<routine::testing::FakeClock>();
  auto store  = std::make_shared<routine::store::RepositoryRecordStore>(std::make_shared<routine::db::memory::MemoryRepository>(), clock);
  auto timers = std::make_shared<routine::testing::ManualTimerFactory>();

  for (int day = 0; day < 3; ++day) {
    google::protobuf::Struct metadata;
    (*metadata.mutable_fields())["taskTitle"].set_string_value("Feed cat");
    (*metadata.mutable_fields())["taskStatus"].set_string_value("completed");
    (*metadata.mutable_fields())["completedAt"].set_string_value(
        routine::util::ToIso8601(routine::testing::FakeClock::AtLocalHour(7) + std::chrono::hours(24 * day)));
    store->AddMemory("Feed cat", "user", "task", "default", 3, metadata);
  }

  routine::core::EngineDependencies deps;
  deps.store         = store;
  deps.timers        = timers;
  deps.state_source  = std::make_shared<routine::testing::FakeStateSource>();
  deps.vision_source = std::make_shared<routine::testing::FakeVisionSource>();
  deps.connectors    = std::make_shared<routine::action::ConnectorRegistry>();
  deps.notifier      = std::make_shared<routine::testing::RecordingNotificationSink>();
  deps.clock         = clock;

  auto engine   = std::make_shared<routine::core::RoutineEngine>(std::move(deps));
  auto patterns = std::make_shared<routine::core::PatternDetector>(store, timers, routine::core::PatternSettings{});
  routine::grpc::RoutineServer server(std::make_shared<routine::service::RoutineService>(engine, patterns));

  v1::ListPatternSuggestionsRequest  list_req;
  v1::ListPatternSuggestionsResponse before;
  ::grpc::ServerContext              before_ctx;
  assert(server.ListPatternSuggestions(&before_ctx, &list_req, &before).ok());
  assert(before.suggestions_size() == 0);

  v1::DetectPatternsRequest  detect_req;
  v1::DetectPatternsResponse detect_resp;
  ::grpc::ServerContext      detect_ctx;
  assert(server.DetectPatterns(&detect_ctx, &detect_req, &detect_resp).ok());
  assert(detect_resp.patterns_size() == 1);
  assert(detect_resp.patterns(0).type() == v1::PATTERN_TYPE_TEMPORAL);
  assert(detect_resp.patterns(0).suggested_routine().name() == "Daily Feed cat");

  v1::ListPatternSuggestionsResponse after;
  ::grpc::ServerContext              after_ctx;
  assert(server.ListPatternSuggestions(&after_ctx, &list_req, &after).ok());
  assert(after.suggestions_size() == 1);
  assert(after.suggestions(0).suggested_routine().trigger().time().schedule() == "every day at 7:00");
}

void TestExceptionMapping() {
  using routine::grpc::ToStatus;
  assert(ToStatus(routine::util::DisabledRoutine("off")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(routine::util::Unsupported("custom")).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
  assert(ToStatus(routine::util::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(routine::util::SetupRequired("no token")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(routine::util::ConnectorError("unreachable")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("disk full")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("disk full")).error_message() == "disk full");
}

} // namespace

int main() {
  TestCreateWithoutActionsReturnsInvalidArgument();
  TestGetMissingRoutineReturnsNotFound();
  TestUpdateAndDeleteMissingRoutineReturnNotFound();
  TestUpdateClearingActionsReturnsInvalidArgument();
  TestExecutionFailuresAreReportedInline();
  TestFireEventRequiresKind();
  TestPatternRpcsWithoutDetectorAreUnimplemented();
  TestPatternRpcsReportDetectedHabits();
  TestExceptionMapping();

  std::cout << "routine_manager_unit_grpc_status: pass\n";
  return 0;
}
