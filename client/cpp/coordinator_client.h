#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "checkpoint/manager/v1.hpp"
#include "internal/worker/coordinator_link.hpp"

namespace checkpoint::manager::client {

/*
  Worker-side client of CheckpointCoordinatorService.

  gRPC status codes become arrow::Status:
    NOT_FOUND            → KeyError
    INVALID_ARGUMENT     → Invalid
    FAILED_PRECONDITION  → Invalid
    anything else        → IOError
*/
class CoordinatorClient final : public checkpoint::worker::CoordinatorLink {
 public:
  explicit CoordinatorClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline = std::chrono::milliseconds(5000));

  arrow::Result<checkpoint::manager::v1::RegisterWorkerResponse> RegisterWorker(const std::string& worker_id,
                                                                                const std::string& advertise_address) override;

  arrow::Result<checkpoint::manager::v1::WorkerStatus> Heartbeat(const std::string& worker_id) override;

  arrow::Status AckSnapshot(uint64_t epoch, const checkpoint::manager::v1::SnapshotRecord& record) override;

  arrow::Status ReportLocalSnapshot(const checkpoint::manager::v1::SnapshotRecord& record) override;

  arrow::Result<checkpoint::manager::v1::RecoveryPoint> GetRecoveryPoint(const std::string& worker_id) override;

  arrow::Result<checkpoint::manager::v1::GetEpochStatusResponse> GetEpochStatus() const;

 private:
  std::unique_ptr<checkpoint::manager::v1::CheckpointCoordinatorService::Stub> stub_;
  std::chrono::milliseconds                                                    deadline_;
};

} // namespace checkpoint::manager::client
