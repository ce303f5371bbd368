#include "internal/grpc/grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace routine::grpc {

namespace {

template <typename Error>
bool Is(const std::exception& e) {
  return dynamic_cast<const Error*>(&e) != nullptr;
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace routine::util;

  if (Is<ValidationError>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (Is<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (Is<AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (Is<DisabledRoutine>(e) || Is<SetupRequired>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  // SetupRequired derives from ConnectorError and is matched first
  if (Is<ConnectorError>(e)) return ::grpc::StatusCode::UNAVAILABLE;
  if (Is<Unsupported>(e)) return ::grpc::StatusCode::UNIMPLEMENTED;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = CodeFor(e);
  if (code == ::grpc::StatusCode::INTERNAL) {
    ROUTINE_LOG_ERROR("Unhandled error in rpc", {observability::StringField("error", e.what())});
  }
  return {code, e.what()};
}

} // namespace routine::grpc
