#pragma once

#include "checkpoint/manager/v1.hpp"
#include "internal/service/service_context.hpp"

namespace checkpoint::service {

class WorkerService {
 public:
  explicit WorkerService(WorkerContext ctx);

  // Captures immediately; the durable write and the ack happen in the background.
  manager::v1::SnapshotBarrierResponse RequestSnapshot(const manager::v1::SnapshotBarrier& req);

 private:
  WorkerContext ctx_;
};

} // namespace checkpoint::service
