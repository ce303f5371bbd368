#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/routine_service.hpp"
#include "routine/manager/v1.hpp"

namespace routine::grpc {

class RoutineServer final : public routine::manager::v1::RoutineAutomationService::Service {
 public:
  explicit RoutineServer(std::shared_ptr<routine::service::RoutineService> svc);

  ::grpc::Status CreateRoutine(::grpc::ServerContext*, const routine::manager::v1::CreateRoutineRequest*,
                               routine::manager::v1::CreateRoutineResponse*) override;

  ::grpc::Status ListRoutines(::grpc::ServerContext*, const routine::manager::v1::ListRoutinesRequest*,
                              routine::manager::v1::ListRoutinesResponse*) override;

  ::grpc::Status GetRoutine(::grpc::ServerContext*, const routine::manager::v1::GetRoutineRequest*,
                            routine::manager::v1::GetRoutineResponse*) override;

  ::grpc::Status UpdateRoutine(::grpc::ServerContext*, const routine::manager::v1::UpdateRoutineRequest*, google::protobuf::Empty*) override;

  ::grpc::Status DeleteRoutine(::grpc::ServerContext*, const routine::manager::v1::DeleteRoutineRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ToggleRoutine(::grpc::ServerContext*, const routine::manager::v1::ToggleRoutineRequest*,
                               routine::manager::v1::ToggleRoutineResponse*) override;

  ::grpc::Status ExecuteRoutine(::grpc::ServerContext*, const routine::manager::v1::ExecuteRoutineRequest*,
                                routine::manager::v1::ExecuteRoutineResponse*) override;

  ::grpc::Status FireEvent(::grpc::ServerContext*, const routine::manager::v1::FireEventRequest*,
                           routine::manager::v1::FireEventResponse*) override;

  ::grpc::Status DetectPatterns(::grpc::ServerContext*, const routine::manager::v1::DetectPatternsRequest*,
                                routine::manager::v1::DetectPatternsResponse*) override;

  ::grpc::Status ListPatternSuggestions(::grpc::ServerContext*, const routine::manager::v1::ListPatternSuggestionsRequest*,
                                        routine::manager::v1::ListPatternSuggestionsResponse*) override;

 private:
  std::shared_ptr<routine::service::RoutineService> service_;
};

} // namespace routine::grpc
