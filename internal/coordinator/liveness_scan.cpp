#include "internal/coordinator/liveness_scan.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace checkpoint::coordinator {

using namespace checkpoint::manager::v1;

size_t ScanLiveness(HeartbeatMonitor& monitor, CoordinatorMailbox& mailbox, util::SteadyTimePoint now) {
  size_t dead = 0;
  for (const auto& transition : monitor.Scan(now)) {
    if (transition.to == WORKER_STATUS_DEAD) {
      CHECKPOINT_LOG_WARN("worker declared dead", {observability::StringField("worker_id", transition.worker_id),
                                                   observability::DurationMsField("limit", static_cast<uint64_t>(monitor.Limit().count()))});
      mailbox.Post(WorkerDead{transition.worker_id});
      ++dead;
    } else {
      CHECKPOINT_LOG_INFO("worker liveness changed", {observability::StringField("worker_id", transition.worker_id),
                                                      observability::StringField("from", WorkerStatus_Name(transition.from)),
                                                      observability::StringField("to", WorkerStatus_Name(transition.to))});
    }
  }

  uint64_t alive = 0, suspect = 0, gone = 0;
  for (const auto& liveness : monitor.Snapshot()) {
    switch (liveness.status) {
      case WORKER_STATUS_ALIVE:
        ++alive;
        break;
      case WORKER_STATUS_SUSPECT:
        ++suspect;
        break;
      case WORKER_STATUS_DEAD:
        ++gone;
        break;
      default:
        break;
    }
  }
  auto& metrics = observability::Metrics::Instance();
  metrics.SetWorkerCount("alive", alive);
  metrics.SetWorkerCount("suspect", suspect);
  metrics.SetWorkerCount("dead", gone);

  return dead;
}

} // namespace checkpoint::coordinator
