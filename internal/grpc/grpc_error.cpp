#include "internal/grpc/grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace checkpoint::grpc {

::grpc::StatusCode StatusCodeFor(const std::exception& e) {
  using namespace checkpoint::util;

  if (dynamic_cast<const CheckpointError*>(&e)) {
    if (dynamic_cast<const NotFound*>(&e)) return ::grpc::StatusCode::NOT_FOUND;
    if (dynamic_cast<const AlreadyExists*>(&e)) return ::grpc::StatusCode::ALREADY_EXISTS;
    if (dynamic_cast<const InvalidState*>(&e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
    if (dynamic_cast<const RecoveryInconsistency*>(&e)) return ::grpc::StatusCode::DATA_LOSS;
    if (dynamic_cast<const StorageWriteFailure*>(&e)) return ::grpc::StatusCode::UNAVAILABLE;
    return ::grpc::StatusCode::INTERNAL;
  }

  if (dynamic_cast<const std::invalid_argument*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  return {StatusCodeFor(e), e.what()};
}

} // namespace checkpoint::grpc
