#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "routine/manager/v1.hpp"

using namespace routine::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  routinectl <addr> list [--enabled]\n"
            << "  routinectl <addr> get <id>\n"
            << "  routinectl <addr> create <request.json>\n"
            << "  routinectl <addr> update <request.json>\n"
            << "  routinectl <addr> delete <id>\n"
            << "  routinectl <addr> toggle <id>\n"
            << "  routinectl <addr> run <id> [--auto]\n"
            << "  routinectl <addr> fire <event|user_action|task_completed> <key>\n"
            << "  routinectl <addr> detect-patterns\n"
            << "  routinectl <addr> suggestions\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return message.ShortDebugString();
  }
  return out;
}

static bool ReadRequest(const std::string& path, google::protobuf::Message* message) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), message);
  if (!status.ok()) {
    std::cerr << "invalid request json: " << status.ToString() << "\n";
    return false;
  }
  return true;
}

static std::optional<EventKind> ParseEventKind(const std::string& value) {
  if (value == "event") {
    return EVENT_KIND_EVENT;
  }
  if (value == "user_action") {
    return EVENT_KIND_USER_ACTION;
  }
  if (value == "task_completed") {
    return EVENT_KIND_TASK_COMPLETED;
  }
  return std::nullopt;
}

static int Report(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RoutineAutomationService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListRoutinesRequest req;
    req.set_enabled_only(argc >= 4 && std::string(argv[3]) == "--enabled");

    ListRoutinesResponse resp;
    auto status = stub->ListRoutines(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    for (const auto& routine : resp.routines()) {
      std::cout << routine.id() << "  " << (routine.enabled() ? "enabled " : "disabled") << "  runs=" << routine.execution_count() << "  "
                << routine.name() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRoutineRequest req;
    req.set_id(argv[3]);

    GetRoutineResponse resp;
    auto status = stub->GetRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << ToJson(resp.routine()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateRoutineRequest req;
    if (!ReadRequest(argv[3], &req)) {
      return 1;
    }

    CreateRoutineResponse resp;
    auto status = stub->CreateRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << "id=" << resp.id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (argc < 4) return 1;

    UpdateRoutineRequest req;
    if (!ReadRequest(argv[3], &req)) {
      return 1;
    }

    google::protobuf::Empty resp;
    auto status = stub->UpdateRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteRoutineRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = stub->DeleteRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "toggle") {
    if (argc < 4) return 1;

    ToggleRoutineRequest req;
    req.set_id(argv[3]);

    ToggleRoutineResponse resp;
    auto status = stub->ToggleRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << "enabled=" << (resp.enabled() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (argc < 4) return 1;

    ExecuteRoutineRequest req;
    req.set_id(argv[3]);
    req.set_manual_trigger(!(argc >= 5 && std::string(argv[4]) == "--auto"));

    ExecuteRoutineResponse resp;
    auto status = stub->ExecuteRoutine(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << ToJson(resp.execution()) << "\n";
    return resp.execution().success() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "fire") {
    if (argc < 5) return 1;

    auto kind = ParseEventKind(argv[3]);
    if (!kind.has_value()) {
      std::cerr << "unsupported event kind: " << argv[3] << "\n";
      return 1;
    }

    FireEventRequest req;
    req.set_kind(kind.value());
    req.set_key(argv[4]);

    FireEventResponse resp;
    auto status = stub->FireEvent(&ctx, req, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    std::cout << "executions=" << resp.executions_size() << "\n";
    for (const auto& execution : resp.executions()) {
      std::cout << ToJson(execution) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "detect-patterns") {
    DetectPatternsResponse resp;
    auto status = stub->DetectPatterns(&ctx, DetectPatternsRequest{}, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    for (const auto& pattern : resp.patterns()) {
      std::cout << ToJson(pattern) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "suggestions") {
    ListPatternSuggestionsResponse resp;
    auto status = stub->ListPatternSuggestions(&ctx, ListPatternSuggestionsRequest{}, &resp);
    if (!status.ok()) {
      return Report(status);
    }

    for (const auto& pattern : resp.suggestions()) {
      std::cout << pattern.confidence() << "  " << pattern.suggested_routine().name() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
