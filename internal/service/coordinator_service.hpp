#pragma once

#include "checkpoint/manager/v1.hpp"
#include "internal/coordinator/coordinator_mailbox.hpp"
#include "internal/service/service_context.hpp"

namespace checkpoint::service {

class CoordinatorService {
 public:
  explicit CoordinatorService(CoordinatorContext ctx);

  manager::v1::RegisterWorkerResponse RegisterWorker(const manager::v1::RegisterWorkerRequest& req);

  manager::v1::HeartbeatResponse Heartbeat(const manager::v1::HeartbeatRequest& req);

  void AckSnapshot(const manager::v1::AckSnapshotRequest& req);

  void ReportLocalSnapshot(const manager::v1::ReportLocalSnapshotRequest& req);

  manager::v1::GetRecoveryPointResponse GetRecoveryPoint(const manager::v1::GetRecoveryPointRequest& req);

  manager::v1::GetEpochStatusResponse GetEpochStatus(const manager::v1::GetEpochStatusRequest& req);

 private:
  void Post(coordinator::CoordinatorEvent event);

  CoordinatorContext ctx_;
};

} // namespace checkpoint::service
