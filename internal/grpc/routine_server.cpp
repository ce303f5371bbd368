#include "internal/grpc/routine_server.hpp"

#include <utility>

#include "internal/grpc/grpc_error.hpp"

namespace routine::grpc {

using namespace routine::manager::v1;

RoutineServer::RoutineServer(std::shared_ptr<routine::service::RoutineService> svc) : service_(std::move(svc)) {
}

::grpc::Status RoutineServer::CreateRoutine(::grpc::ServerContext*, const CreateRoutineRequest* req, CreateRoutineResponse* resp) {
  try {
    *resp = service_->CreateRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::ListRoutines(::grpc::ServerContext*, const ListRoutinesRequest* req, ListRoutinesResponse* resp) {
  try {
    *resp = service_->ListRoutines(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::GetRoutine(::grpc::ServerContext*, const GetRoutineRequest* req, GetRoutineResponse* resp) {
  try {
    *resp = service_->GetRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::UpdateRoutine(::grpc::ServerContext*, const UpdateRoutineRequest* req, google::protobuf::Empty*) {
  try {
    service_->UpdateRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::DeleteRoutine(::grpc::ServerContext*, const DeleteRoutineRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::ToggleRoutine(::grpc::ServerContext*, const ToggleRoutineRequest* req, ToggleRoutineResponse* resp) {
  try {
    *resp = service_->ToggleRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::ExecuteRoutine(::grpc::ServerContext*, const ExecuteRoutineRequest* req, ExecuteRoutineResponse* resp) {
  try {
    *resp = service_->ExecuteRoutine(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::FireEvent(::grpc::ServerContext*, const FireEventRequest* req, FireEventResponse* resp) {
  try {
    *resp = service_->FireEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::DetectPatterns(::grpc::ServerContext*, const DetectPatternsRequest* req, DetectPatternsResponse* resp) {
  try {
    *resp = service_->DetectPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoutineServer::ListPatternSuggestions(::grpc::ServerContext*, const ListPatternSuggestionsRequest* req,
                                                     ListPatternSuggestionsResponse* resp) {
  try {
    *resp = service_->ListPatternSuggestions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace routine::grpc
