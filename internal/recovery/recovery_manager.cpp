#include "internal/recovery/recovery_manager.hpp"

#include <iterator>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::recovery {

using namespace checkpoint::manager::v1;

namespace {

WorkerRecoveryPlan PlanFromRecord(const SnapshotRecord& record) {
  WorkerRecoveryPlan plan;
  plan.set_worker_id(record.worker_id());
  plan.set_has_snapshot(true);
  *plan.mutable_record()      = record;
  *plan.mutable_replay_from() = record.offsets();
  return plan;
}

} // namespace

WorkerRecoveryPlan EmptyPlan(const std::string& worker_id) {
  WorkerRecoveryPlan plan;
  plan.set_worker_id(worker_id);
  plan.set_has_snapshot(false);
  return plan;
}

RecoveryManager::RecoveryManager(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, storage::SnapshotStorePtr store)
    : strategy_(strategy), manifest_(std::move(manifest)), store_(std::move(store)) {
  if (!manifest_ || !store_) {
    throw std::invalid_argument("recovery manager requires a manifest and a snapshot store");
  }
}

bool RecoveryManager::Validate(const SnapshotRecord& record) const {
  std::shared_ptr<arrow::Buffer> blob;
  try {
    blob = store_->Get(record.storage_key());
  } catch (const std::exception& e) {
    CHECKPOINT_LOG_WARN("snapshot blob unavailable",
                        {observability::StringField("worker_id", record.worker_id()),
                         observability::StringField("key", record.storage_key()),
                         observability::StringField("error", e.what())});
    return false;
  }

  if (static_cast<uint64_t>(blob->size()) != record.size_bytes()) {
    CHECKPOINT_LOG_WARN("snapshot blob size mismatch",
                        {observability::StringField("key", record.storage_key()),
                         observability::IntField("expected", static_cast<int64_t>(record.size_bytes())),
                         observability::IntField("actual", blob->size())});
    return false;
  }
  if (util::Crc32c::Compute(blob->data(), static_cast<size_t>(blob->size())) != record.checksum()) {
    CHECKPOINT_LOG_WARN("snapshot blob checksum mismatch", {observability::StringField("key", record.storage_key())});
    return false;
  }
  return true;
}

RecoveryPoint RecoveryManager::SelectRecoveryPoint() const {
  return strategy_ == STRATEGY_COORDINATED ? SelectCoordinated() : SelectUncoordinated();
}

RecoveryPoint RecoveryManager::Current() const {
  const bool nothing_recorded =
      strategy_ == STRATEGY_COORDINATED ? manifest_->CompletedEpochs().empty() : manifest_->LocalWorkers().empty();
  if (nothing_recorded) {
    RecoveryPoint point;
    point.set_strategy(strategy_);
    return point;
  }
  return SelectRecoveryPoint();
}

RecoveryPoint RecoveryManager::SelectCoordinated() const {
  auto complete = manifest_->CompletedEpochs();

  for (auto it = complete.rbegin(); it != complete.rend(); ++it) {
    bool valid = true;
    for (const auto& record : it->records()) {
      if (!Validate(record)) {
        valid = false;
        break;
      }
    }
    if (!valid) {
      CHECKPOINT_LOG_WARN("complete epoch failed validation, trying an older one",
                          {observability::IntField("epoch", static_cast<int64_t>(it->epoch()))});
      continue;
    }

    RecoveryPoint point;
    point.set_strategy(STRATEGY_COORDINATED);
    point.set_epoch(it->epoch());
    std::set<std::string> planned;
    for (const auto& record : it->records()) {
      *point.add_workers() = PlanFromRecord(record);
      planned.insert(record.worker_id());
    }

    // Workers shrunk out of the newer epochs resume from their own last
    // complete snapshot instead of from scratch.
    size_t carried = 0;
    for (auto older = std::next(it); older != complete.rend(); ++older) {
      for (const auto& record : older->records()) {
        if (planned.count(record.worker_id()) > 0 || !Validate(record)) continue;
        *point.add_workers() = PlanFromRecord(record);
        planned.insert(record.worker_id());
        ++carried;
      }
    }

    CHECKPOINT_LOG_INFO("recovery point selected",
                        {observability::StringField("strategy", "coordinated"),
                         observability::IntField("epoch", static_cast<int64_t>(point.epoch())),
                         observability::IntField("workers", point.workers_size()),
                         observability::IntField("carried", static_cast<int64_t>(carried))});
    return point;
  }

  throw util::RecoveryInconsistency("no complete epoch with valid snapshots in manifest");
}

RecoveryPoint RecoveryManager::SelectUncoordinated() const {
  RecoveryPoint point;
  point.set_strategy(STRATEGY_UNCOORDINATED);

  size_t restored = 0;
  for (const auto& worker_id : manifest_->LocalWorkers()) {
    auto records = manifest_->LocalRecords(worker_id);

    const SnapshotRecord* chosen = nullptr;
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
      if (Validate(*it)) {
        chosen = &*it;
        break;
      }
    }

    if (chosen == nullptr) {
      CHECKPOINT_LOG_WARN("no valid local snapshot, worker replays from the start", {observability::StringField("worker_id", worker_id)});
      *point.add_workers() = EmptyPlan(worker_id);
      continue;
    }

    *point.add_workers() = PlanFromRecord(*chosen);
    ++restored;
  }

  if (restored == 0) {
    throw util::RecoveryInconsistency("no valid local snapshot for any worker in manifest");
  }

  CHECKPOINT_LOG_INFO("recovery point selected",
                      {observability::StringField("strategy", "uncoordinated"),
                       observability::IntField("workers", point.workers_size()),
                       observability::IntField("restored", static_cast<int64_t>(restored))});
  return point;
}

void RecoveryManager::MarkRecoveryPending(const std::string& worker_id) {
  std::lock_guard lock(pending_mutex_);
  if (pending_.insert(worker_id).second) {
    observability::Metrics::Instance().SetRecoveryPending(pending_.size());
  }
}

void RecoveryManager::MarkRecovered(const std::string& worker_id) {
  std::lock_guard lock(pending_mutex_);
  if (pending_.erase(worker_id) > 0) {
    observability::Metrics::Instance().SetRecoveryPending(pending_.size());
    CHECKPOINT_LOG_INFO("worker fetched its recovery point", {observability::StringField("worker_id", worker_id)});
  }
}

std::vector<std::string> RecoveryManager::PendingRecovery() const {
  std::lock_guard lock(pending_mutex_);
  return {pending_.begin(), pending_.end()};
}

WorkerRecoveryPlan RecoveryManager::PlanFor(const RecoveryPoint& point, const std::string& worker_id) {
  for (const auto& plan : point.workers()) {
    if (plan.worker_id() == worker_id) return plan;
  }
  return EmptyPlan(worker_id);
}

} // namespace checkpoint::recovery
