#include "internal/grpc/worker_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace checkpoint::grpc {

WorkerServer::WorkerServer(std::shared_ptr<checkpoint::service::WorkerService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkerServer::RequestSnapshot(::grpc::ServerContext*, const checkpoint::manager::v1::SnapshotBarrier* req,
                                             checkpoint::manager::v1::SnapshotBarrierResponse* resp) {
  try {
    *resp = service_->RequestSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace checkpoint::grpc
