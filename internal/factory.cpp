#include "internal/factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/action/notification_sink.hpp"
#include "internal/connectors/connector_config.hpp"
#include "internal/connectors/connector_handlers.hpp"
#include "internal/connectors/home_assistant_client.hpp"
#include "internal/connectors/vision_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/grpc/routine_server.hpp"
#include "internal/http/curl_http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/routine_service.hpp"
#include "internal/store/repository_record_store.hpp"
#include "internal/trigger/thread_timer.hpp"
#include "internal/util/time.hpp"

namespace routine::factory {

using namespace routine;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kDefaultPersona     = "default";
constexpr int32_t     kDefaultImportance  = 8;
constexpr const char* kDefaultNotifyTitle = "Routine";

trigger::TriggerSettings BuildTriggerSettings(const runtime::config::TriggerConfig& config) {
  trigger::TriggerSettings settings;
  if (config.state_poll_interval_ms() > 0) {
    settings.state_poll_interval = std::chrono::milliseconds(config.state_poll_interval_ms());
  }
  if (config.vision_default_interval_ms() > 0) {
    settings.vision_default_interval = std::chrono::milliseconds(config.vision_default_interval_ms());
  }
  if (config.vision_default_min_confidence() > 0) {
    settings.vision_default_min_confidence = config.vision_default_min_confidence();
  }
  return settings;
}

core::PatternSettings BuildPatternSettings(const runtime::config::PatternDetectionConfig& config) {
  core::PatternSettings settings;
  if (config.has_enabled()) {
    settings.enabled = config.enabled();
  }
  if (config.min_occurrences() > 0) {
    settings.min_occurrences = config.min_occurrences();
  }
  if (config.confidence_threshold() > 0) {
    settings.confidence_threshold = config.confidence_threshold();
  }
  if (config.check_interval_ms() > 0) {
    settings.check_interval = std::chrono::milliseconds(config.check_interval_ms());
  }
  return settings;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    const auto& sqlite       = database.sqlite();
    const int   busy_timeout = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms())
                                                             : db::sqlite::SqliteDB::kDefaultBusyTimeoutMs;

    auto      sqlite_db      = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode(), busy_timeout);
    const int schema_version = db::sqlite::ApplySchema(*sqlite_db);
    ROUTINE_LOG_INFO("Using sqlite record store",
                     {StringField("path", sqlite.path()), IntField("schema_version", schema_version)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  ROUTINE_LOG_INFO("Using in-memory record store");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto clock        = util::SystemClock();
  app.repository    = BuildRepository(config);
  auto record_store = std::make_shared<store::RepositoryRecordStore>(app.repository, clock);

  // ------------------------------------------------------------------
  // Connectors
  // ------------------------------------------------------------------
  const auto connector_config = connectors::ResolveConnectorsConfig(config.connectors());
  auto http                   = std::make_shared<http::CurlHttpClient>(std::chrono::milliseconds(connector_config.request_timeout_ms()));
  auto home_assistant         = std::make_shared<connectors::HomeAssistantClient>(http, connector_config.home_assistant());
  auto vision                 = std::make_shared<connectors::VisionClient>(http, connector_config);
  auto registry               = connectors::BuildConnectorRegistry(home_assistant, vision);

  if (!home_assistant->Configured()) {
    ROUTINE_LOG_WARN("Home Assistant not configured; state triggers and conditions will fail until it is");
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.timers = std::make_shared<trigger::ThreadTimerFactory>();

  core::EngineDependencies deps;
  deps.store            = record_store;
  deps.timers           = app.timers;
  deps.state_source     = home_assistant;
  deps.vision_source    = vision;
  deps.connectors       = registry;
  deps.notifier         = action::BuildNotificationSink(config.notifications());
  deps.clock            = clock;
  deps.trigger_settings = BuildTriggerSettings(config.triggers());

  deps.persona            = config.store().persona().empty() ? kDefaultPersona : config.store().persona();
  deps.importance         = config.store().importance() > 0 ? config.store().importance() : kDefaultImportance;
  deps.notification_title = config.notifications().title().empty() ? kDefaultNotifyTitle : config.notifications().title();

  app.engine = std::make_shared<core::RoutineEngine>(std::move(deps));

  app.patterns = std::make_shared<core::PatternDetector>(record_store, app.timers, BuildPatternSettings(config.patterns()));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto routine_service = std::make_shared<service::RoutineService>(app.engine, app.patterns);
  app.grpc_services.push_back(std::make_unique<grpc::RoutineServer>(routine_service));

  return app;
}

} // namespace routine::factory
