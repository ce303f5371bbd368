#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/core/pattern_detector.hpp"
#include "internal/core/routine_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/trigger/timer.hpp"

namespace routine::factory {

/*
  Application

  Owns every long-lived object of the server process. The engine and
  the pattern detector must be stopped before the timer factory is
  released.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<trigger::TimerFactory>        timers;
  std::shared_ptr<core::RoutineEngine>          engine;
  std::shared_ptr<core::PatternDetector>        patterns;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Builds the storage backend selected by config.database (memory by default).
std::shared_ptr<db::Repository> BuildRepository(const routine::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backends and
  connector clients. The returned engine and detector are not started.
*/
Application Build(const routine::runtime::config::RuntimeConfig& config);

} // namespace routine::factory
