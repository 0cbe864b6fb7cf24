#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "checkpoint/manager/v1.hpp"
#include "internal/service/worker_service.hpp"

namespace checkpoint::grpc {

class WorkerServer final : public checkpoint::manager::v1::CheckpointWorkerService::Service {
 public:
  explicit WorkerServer(std::shared_ptr<checkpoint::service::WorkerService> svc);

  ::grpc::Status RequestSnapshot(::grpc::ServerContext*, const checkpoint::manager::v1::SnapshotBarrier*,
                                 checkpoint::manager::v1::SnapshotBarrierResponse*) override;

 private:
  std::shared_ptr<checkpoint::service::WorkerService> service_;
};

} // namespace checkpoint::grpc
