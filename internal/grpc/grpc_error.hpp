#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace routine::grpc {

/*
  Maps the routine::util error hierarchy to gRPC status codes.

    ValidationError   INVALID_ARGUMENT
    NotFound          NOT_FOUND
    AlreadyExists     ALREADY_EXISTS
    DisabledRoutine   FAILED_PRECONDITION
    SetupRequired     FAILED_PRECONDITION
    ConnectorError    UNAVAILABLE
    Unsupported       UNIMPLEMENTED
    anything else     INTERNAL (logged)
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace routine::grpc
