#include "internal/coordinator/coordinator_loop.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::coordinator {

using namespace checkpoint::manager::v1;

CoordinatorLoop::CoordinatorLoop(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, std::shared_ptr<HeartbeatMonitor> monitor,
                                 std::shared_ptr<BarrierBroadcaster> broadcaster, std::shared_ptr<CoordinatorMailbox> mailbox)
    : strategy_(strategy),
      manifest_(manifest),
      monitor_(std::move(monitor)),
      broadcaster_(std::move(broadcaster)),
      mailbox_(std::move(mailbox)),
      epochs_(std::move(manifest)) {
  if (!monitor_ || !mailbox_) {
    throw std::invalid_argument("coordinator loop requires a heartbeat monitor and a mailbox");
  }
  if (strategy_ == STRATEGY_COORDINATED && !broadcaster_) {
    throw std::invalid_argument("coordinated strategy requires a barrier broadcaster");
  }
}

CoordinatorLoop::~CoordinatorLoop() {
  Stop();
}

void CoordinatorLoop::Recover(uint64_t highest_stored_epoch) {
  epochs_.Recover(highest_stored_epoch);
  Publish();
}

void CoordinatorLoop::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread([this] { Run(); });
}

void CoordinatorLoop::Stop() {
  if (!running_.exchange(false)) return;
  mailbox_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void CoordinatorLoop::OnEpochComplete(EpochCompleteHook hook) {
  on_complete_ = std::move(hook);
}

void CoordinatorLoop::OnWorkerDead(WorkerDeadHook hook) {
  on_dead_ = std::move(hook);
}

void CoordinatorLoop::Run() {
  while (running_) {
    auto event = mailbox_->Dequeue();
    if (!event) break;
    Handle(*event);
  }
}

bool CoordinatorLoop::RunOnce(std::chrono::milliseconds wait) {
  auto event = mailbox_->TryDequeueFor(wait);
  if (!event) return false;
  Handle(*event);
  return true;
}

void CoordinatorLoop::Handle(const CoordinatorEvent& event) {
  try {
    std::visit(
        [this](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, EpochTick>) {
            HandleTick();
          } else if constexpr (std::is_same_v<T, SnapshotAcked>) {
            HandleAck(e);
          } else if constexpr (std::is_same_v<T, LocalSnapshotReported>) {
            HandleLocal(e);
          } else if constexpr (std::is_same_v<T, WorkerDead>) {
            HandleDead(e);
          } else if constexpr (std::is_same_v<T, WorkerRejoined>) {
            CHECKPOINT_LOG_INFO("worker rejoined", {observability::StringField("worker_id", e.worker_id)});
          }
        },
        event);
  } catch (const std::exception& e) {
    // Manifest writes can fail; the event is dropped and the next tick retries.
    CHECKPOINT_LOG_ERROR("coordinator event failed", {observability::StringField("error", e.what())});
  }
  Publish();
}

void CoordinatorLoop::HandleTick() {
  const auto now = util::SteadyNow();
  observability::Metrics::Instance().SetEpochStalledMs(epochs_.StalledFor(now));

  if (strategy_ != STRATEGY_COORDINATED) return;

  auto request = epochs_.Trigger(monitor_->AliveWorkers(), now);
  if (!request) return;

  observability::SpanScope span("checkpoint.epoch.barrier");
  span.SetAttribute("epoch", static_cast<std::int64_t>(request->epoch));

  const auto accepted = broadcaster_->Broadcast(request->epoch, request->workers);
  span.SetAttribute("accepted", static_cast<std::int64_t>(accepted));
  epochs_.OnBarrierSent(request->epoch);
}

void CoordinatorLoop::HandleAck(const SnapshotAcked& ack) {
  if (epochs_.OnAck(ack.epoch, ack.record, util::SteadyNow()) == AckOutcome::kCompleted) {
    NotifyComplete();
  }
}

void CoordinatorLoop::HandleLocal(const LocalSnapshotReported& report) {
  try {
    manifest_->AppendLocal(report.record);
  } catch (const util::InvalidState& e) {
    CHECKPOINT_LOG_WARN("rejected local snapshot report",
                        {observability::StringField("worker_id", report.record.worker_id()),
                         observability::IntField("sequence", static_cast<int64_t>(report.record.generation())),
                         observability::StringField("error", e.what())});
  }
}

void CoordinatorLoop::HandleDead(const WorkerDead& dead) {
  const auto outcome = epochs_.OnWorkerDead(dead.worker_id, util::SteadyNow());
  if (outcome == DeathOutcome::kCompleted) {
    NotifyComplete();
  }

  CHECKPOINT_LOG_WARN("worker dead, recovery pending",
                      {observability::StringField("worker_id", dead.worker_id),
                       observability::BoolField("epoch_affected", outcome != DeathOutcome::kIgnored)});
  if (on_dead_) on_dead_(dead.worker_id);
}

void CoordinatorLoop::NotifyComplete() {
  observability::Metrics::Instance().SetEpochStalledMs(0);
  if (on_complete_) on_complete_(epochs_.LatestComplete());
}

void CoordinatorLoop::Publish() {
  const auto now  = util::SteadyNow();
  auto       view = epochs_.View(now);

  std::lock_guard lock(view_mutex_);
  view_    = std::move(view);
  view_at_ = now;
}

EpochView CoordinatorLoop::Status() const {
  std::lock_guard lock(view_mutex_);
  EpochView       view = view_;
  if (view.state != EPOCH_STATE_IDLE) {
    view.pending_ms += util::ElapsedMillis(view_at_, util::SteadyNow());
  }
  return view;
}

} // namespace checkpoint::coordinator
