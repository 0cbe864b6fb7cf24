#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "checkpoint/manager/v1.hpp"
#include "internal/service/coordinator_service.hpp"

namespace checkpoint::grpc {

class CoordinatorServer final : public checkpoint::manager::v1::CheckpointCoordinatorService::Service {
 public:
  explicit CoordinatorServer(std::shared_ptr<checkpoint::service::CoordinatorService> svc);

  ::grpc::Status RegisterWorker(::grpc::ServerContext*, const checkpoint::manager::v1::RegisterWorkerRequest*,
                                checkpoint::manager::v1::RegisterWorkerResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const checkpoint::manager::v1::HeartbeatRequest*,
                           checkpoint::manager::v1::HeartbeatResponse*) override;

  ::grpc::Status AckSnapshot(::grpc::ServerContext*, const checkpoint::manager::v1::AckSnapshotRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ReportLocalSnapshot(::grpc::ServerContext*, const checkpoint::manager::v1::ReportLocalSnapshotRequest*,
                                     google::protobuf::Empty*) override;

  ::grpc::Status GetRecoveryPoint(::grpc::ServerContext*, const checkpoint::manager::v1::GetRecoveryPointRequest*,
                                  checkpoint::manager::v1::GetRecoveryPointResponse*) override;

  ::grpc::Status GetEpochStatus(::grpc::ServerContext*, const checkpoint::manager::v1::GetEpochStatusRequest*,
                                checkpoint::manager::v1::GetEpochStatusResponse*) override;

 private:
  std::shared_ptr<checkpoint::service::CoordinatorService> service_;
};

} // namespace checkpoint::grpc
