#include "internal/service/worker_service.hpp"

#include <stdexcept>

#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/snapshot_engine.hpp"

namespace checkpoint::service {

using namespace checkpoint::manager::v1;

WorkerService::WorkerService(WorkerContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine) {
    throw std::invalid_argument("worker service requires a snapshot engine");
  }
}

SnapshotBarrierResponse WorkerService::RequestSnapshot(const SnapshotBarrier& req) {
  return ObserveRpc("WorkerService.RequestSnapshot", ctx_.engine->WorkerId(), [&] {
    if (ctx_.strategy != STRATEGY_COORDINATED) {
      throw util::InvalidState("worker is not running the coordinated strategy");
    }
    if (req.epoch() == 0) {
      throw std::invalid_argument("barrier epoch must be positive");
    }

    SnapshotBarrierResponse resp;
    resp.set_accepted(ctx_.engine->Submit(worker::SnapshotTrigger::Coordinated(req.epoch())));
    return resp;
  });
}

} // namespace checkpoint::service
