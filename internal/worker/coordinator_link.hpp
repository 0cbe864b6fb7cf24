#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <string>

#include "checkpoint/manager/v1.hpp"

namespace checkpoint::worker {

/*
  Worker → coordinator calls.

  Errors come back as arrow::Status: KeyError when the coordinator does not
  know the worker, IOError when it cannot be reached.
*/
class CoordinatorLink {
 public:
  virtual ~CoordinatorLink() = default;

  virtual arrow::Result<manager::v1::RegisterWorkerResponse> RegisterWorker(const std::string& worker_id,
                                                                            const std::string& advertise_address) = 0;

  virtual arrow::Result<manager::v1::WorkerStatus> Heartbeat(const std::string& worker_id) = 0;

  virtual arrow::Status AckSnapshot(uint64_t epoch, const manager::v1::SnapshotRecord& record) = 0;

  virtual arrow::Status ReportLocalSnapshot(const manager::v1::SnapshotRecord& record) = 0;

  virtual arrow::Result<manager::v1::RecoveryPoint> GetRecoveryPoint(const std::string& worker_id) = 0;
};

} // namespace checkpoint::worker
