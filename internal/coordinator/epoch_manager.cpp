#include "internal/coordinator/epoch_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace checkpoint::coordinator {

using namespace checkpoint::manager::v1;

EpochManager::EpochManager(manifest::SnapshotManifestPtr manifest) : manifest_(std::move(manifest)) {
  if (!manifest_) {
    throw std::invalid_argument("epoch manager requires a manifest");
  }
}

void EpochManager::Recover(uint64_t highest_stored) {
  for (auto entry : manifest_->PendingEpochs()) {
    CHECKPOINT_LOG_WARN("abandoning epoch left pending before restart",
                        {observability::IntField("epoch", static_cast<int64_t>(entry.epoch())),
                         observability::StringField("state", EpochState_Name(entry.state()))});
    entry.set_state(EPOCH_STATE_INCOMPLETE);
    *entry.mutable_finished_at() = util::ToProto(util::Now());
    manifest_->PutEpoch(entry);
  }

  next_epoch_ = std::max(manifest_->MaxEpoch(), highest_stored) + 1;

  auto complete    = manifest_->CompletedEpochs();
  latest_complete_ = complete.empty() ? 0 : complete.back().epoch();
  in_flight_.reset();

  CHECKPOINT_LOG_INFO("epoch manager recovered",
                      {observability::IntField("next_epoch", static_cast<int64_t>(next_epoch_)),
                       observability::IntField("highest_stored", static_cast<int64_t>(highest_stored)),
                       observability::IntField("latest_complete", static_cast<int64_t>(latest_complete_))});
}

std::optional<BarrierRequest> EpochManager::Trigger(const std::vector<std::string>& alive, util::SteadyTimePoint now) {
  if (in_flight_) {
    CHECKPOINT_LOG_WARN("epoch still pending, skipping trigger",
                        {observability::IntField("epoch", static_cast<int64_t>(in_flight_->entry.epoch())),
                         observability::DurationMsField("stalled", StalledFor(now))});
    return std::nullopt;
  }
  if (alive.empty()) {
    CHECKPOINT_LOG_DEBUG("no alive workers, skipping epoch trigger");
    return std::nullopt;
  }

  PendingEpoch pending;
  pending.required = std::set<std::string>(alive.begin(), alive.end());
  pending.started  = now;

  auto& entry = pending.entry;
  entry.set_epoch(next_epoch_);
  entry.set_state(EPOCH_STATE_SNAPSHOT_REQUESTED);
  for (const auto& worker_id : pending.required) {
    entry.add_required_workers(worker_id);
  }
  *entry.mutable_requested_at() = util::ToProto(util::Now());

  // Persisted before any barrier leaves the coordinator.
  manifest_->PutEpoch(entry);

  ++next_epoch_;
  in_flight_ = std::move(pending);

  BarrierRequest request;
  request.epoch   = in_flight_->entry.epoch();
  request.workers = std::vector<std::string>(in_flight_->required.begin(), in_flight_->required.end());

  CHECKPOINT_LOG_INFO("epoch requested",
                      {observability::IntField("epoch", static_cast<int64_t>(request.epoch)),
                       observability::IntField("workers", static_cast<int64_t>(request.workers.size()))});
  return request;
}

void EpochManager::OnBarrierSent(uint64_t epoch) {
  if (!in_flight_ || in_flight_->entry.epoch() != epoch) return;
  if (in_flight_->entry.state() != EPOCH_STATE_SNAPSHOT_REQUESTED) return;
  Persist(EPOCH_STATE_COLLECTING_ACKS);
}

AckOutcome EpochManager::OnAck(uint64_t epoch, const SnapshotRecord& record, util::SteadyTimePoint now) {
  if (!in_flight_ || in_flight_->entry.epoch() != epoch) {
    CHECKPOINT_LOG_DEBUG("ignoring ack for epoch not in flight",
                         {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                          observability::StringField("worker_id", record.worker_id())});
    return AckOutcome::kIgnored;
  }
  if (record.generation() != epoch || record.strategy() != STRATEGY_COORDINATED) {
    CHECKPOINT_LOG_WARN("ignoring ack with mismatched record",
                        {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                         observability::IntField("generation", static_cast<int64_t>(record.generation())),
                         observability::StringField("worker_id", record.worker_id())});
    return AckOutcome::kIgnored;
  }
  if (in_flight_->required.count(record.worker_id()) == 0) {
    CHECKPOINT_LOG_DEBUG("ignoring ack from worker outside the required set",
                         {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                          observability::StringField("worker_id", record.worker_id())});
    return AckOutcome::kIgnored;
  }
  if (in_flight_->acked.count(record.worker_id()) != 0) {
    return AckOutcome::kRecorded;
  }

  in_flight_->acked.emplace(record.worker_id(), record);
  if (AllAcked()) {
    Finish(EPOCH_STATE_COMPLETE, now);
    return AckOutcome::kCompleted;
  }
  return AckOutcome::kRecorded;
}

DeathOutcome EpochManager::OnWorkerDead(const std::string& worker_id, util::SteadyTimePoint now) {
  if (!in_flight_) return DeathOutcome::kIgnored;

  // A worker that already acked keeps its durable record in the epoch.
  if (in_flight_->required.count(worker_id) == 0 || in_flight_->acked.count(worker_id) != 0) {
    return DeathOutcome::kIgnored;
  }

  in_flight_->required.erase(worker_id);
  CHECKPOINT_LOG_WARN("dead worker removed from epoch",
                      {observability::IntField("epoch", static_cast<int64_t>(in_flight_->entry.epoch())),
                       observability::StringField("worker_id", worker_id)});

  if (in_flight_->required.empty()) {
    Finish(EPOCH_STATE_INCOMPLETE, now);
    return DeathOutcome::kAbandoned;
  }
  if (AllAcked()) {
    Finish(EPOCH_STATE_COMPLETE, now);
    return DeathOutcome::kCompleted;
  }
  Persist(in_flight_->entry.state());
  return DeathOutcome::kShrunk;
}

uint64_t EpochManager::StalledFor(util::SteadyTimePoint now) const {
  if (!in_flight_) return 0;
  return util::ElapsedMillis(in_flight_->started, now);
}

EpochView EpochManager::View(util::SteadyTimePoint now) const {
  EpochView view;
  view.latest_complete = latest_complete_;
  if (!in_flight_) {
    view.current_epoch = next_epoch_ - 1;
    return view;
  }

  view.current_epoch = in_flight_->entry.epoch();
  view.state         = in_flight_->entry.state();
  view.pending_ms    = StalledFor(now);
  view.requested_at  = util::FromProto(in_flight_->entry.requested_at());
  for (const auto& worker_id : in_flight_->required) {
    if (in_flight_->acked.count(worker_id) == 0) view.missing_acks.push_back(worker_id);
  }
  return view;
}

bool EpochManager::AllAcked() const {
  return std::all_of(in_flight_->required.begin(), in_flight_->required.end(), [&](const std::string& worker_id) {
    return in_flight_->acked.count(worker_id) != 0;
  });
}

void EpochManager::Persist(EpochState state) {
  ManifestEntry entry = in_flight_->entry;
  entry.set_state(state);
  entry.clear_required_workers();
  for (const auto& worker_id : in_flight_->required) {
    entry.add_required_workers(worker_id);
  }
  entry.clear_records();
  for (const auto& [_, record] : in_flight_->acked) {
    *entry.add_records() = record;
  }
  if (manifest::IsTerminal(state)) {
    *entry.mutable_finished_at() = util::ToProto(util::Now());
  }

  manifest_->PutEpoch(entry);
  in_flight_->entry = std::move(entry);
}

void EpochManager::Finish(EpochState state, util::SteadyTimePoint now) {
  Persist(state);

  const auto epoch  = in_flight_->entry.epoch();
  last_duration_ms_ = StalledFor(now);
  if (state == EPOCH_STATE_COMPLETE) {
    latest_complete_ = epoch;
  }
  in_flight_.reset();

  observability::Metrics::Instance().RecordEpochFinished(state == EPOCH_STATE_COMPLETE ? "complete" : "incomplete",
                                                         static_cast<double>(last_duration_ms_));

  if (state == EPOCH_STATE_COMPLETE) {
    CHECKPOINT_LOG_INFO("epoch complete",
                        {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                         observability::DurationMsField("duration", last_duration_ms_)});
  } else {
    CHECKPOINT_LOG_WARN("epoch abandoned, every required worker is dead",
                        {observability::IntField("epoch", static_cast<int64_t>(epoch))});
  }
}

} // namespace checkpoint::coordinator
