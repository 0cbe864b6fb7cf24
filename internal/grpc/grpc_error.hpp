#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace checkpoint::grpc {

// Status code for an exception escaping a service call.
::grpc::StatusCode StatusCodeFor(const std::exception& e);

::grpc::Status ToStatus(const std::exception& e);

} // namespace checkpoint::grpc
