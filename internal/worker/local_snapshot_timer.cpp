#include "internal/worker/local_snapshot_timer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::worker {

LocalSnapshotTimer::LocalSnapshotTimer(std::shared_ptr<SnapshotEngine> engine, std::chrono::milliseconds frequency)
    : engine_(std::move(engine)), task_("local-snapshot", frequency, [this] { Tick(); }) {
  if (!engine_) {
    throw std::invalid_argument("local snapshot timer requires a snapshot engine");
  }
}

void LocalSnapshotTimer::Start() {
  task_.Start();
}

void LocalSnapshotTimer::Stop() {
  task_.Stop();
}

bool LocalSnapshotTimer::Tick() {
  if (engine_->InProgress()) {
    CHECKPOINT_LOG_DEBUG("previous local snapshot still in progress, skipping tick",
                         {observability::StringField("worker_id", engine_->WorkerId())});
    return false;
  }
  return engine_->Submit(SnapshotTrigger::Local());
}

} // namespace checkpoint::worker
