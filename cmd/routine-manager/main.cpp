#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using routine::observability::StringField;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

void PrintUsage() {
  std::cerr << "Usage: routine-manager [--check] [--config] <config.yaml>\n"
               "       the path defaults to $ROUTINE_MANAGER_CONFIG\n"
               "  --check   load and validate the configuration, then exit\n";
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }

  if (options.config_path.empty()) {
    if (const char* env = std::getenv("ROUTINE_MANAGER_CONFIG")) {
      options.config_path = env;
    }
  }
  if (options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage();
    return 1;
  }

  try {
    const auto config = routine::config::ConfigLoader::LoadFromYaml(options->config_path);
    if (options->check_only) {
      std::cout << options->config_path << ": ok\n";
      return 0;
    }

    routine::observability::InitializeLogging(config);

    auto app = routine::factory::Build(config);

    routine::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    // triggers first so the first RPC already sees a running engine
    app.engine->Start();
    app.patterns->Start();
    server.Start();
    ROUTINE_LOG_INFO("Routine manager started",
                     {StringField("bind_address", config.server().bind_address()), StringField("config", options->config_path)});

    while (!g_stop_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    ROUTINE_LOG_INFO("Stopping routine manager");
    server.Stop();
    app.patterns->Stop();
    app.engine->Shutdown();
    routine::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ROUTINE_LOG_ERROR("Routine manager failed", {StringField("error", e.what())});
    std::cerr << "routine-manager: " << e.what() << "\n";
    routine::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
