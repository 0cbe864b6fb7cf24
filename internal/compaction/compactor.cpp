#include "internal/compaction/compactor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/key_layout.hpp"

namespace checkpoint::compaction {

using namespace checkpoint::manager::v1;

namespace {

// Deletes every snapshot key under `prefix` whose generation is below `horizon`.
void RemoveBelow(storage::SnapshotStore& store, const std::string& prefix, uint64_t horizon, CompactionReport& report) {
  for (const auto& key : store.List(prefix)) {
    auto parsed = storage::common::ParseSnapshotKey(key);
    if (!parsed || parsed->generation >= horizon) continue;

    try {
      store.Remove(key);
      ++report.deleted_objects;
    } catch (const std::exception& e) {
      ++report.failures;
      CHECKPOINT_LOG_WARN("snapshot deletion failed, retrying next run",
                          {observability::StringField("key", key), observability::StringField("error", e.what())});
    }
  }
}

} // namespace

Compactor::Compactor(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, storage::SnapshotStorePtr store)
    : strategy_(strategy), manifest_(std::move(manifest)), store_(std::move(store)) {
  if (!manifest_ || !store_) {
    throw std::invalid_argument("compactor requires a manifest and a snapshot store");
  }
}

CompactionReport Compactor::RunOnce() {
  observability::SpanScope span("checkpoint.compaction");

  CompactionReport report;
  try {
    report = strategy_ == STRATEGY_COORDINATED ? CompactCoordinated() : CompactUncoordinated();
  } catch (const std::exception& e) {
    ++report.failures;
    span.RecordException(e.what());
    CHECKPOINT_LOG_WARN("compaction run failed", {observability::StringField("error", e.what())});
  }

  observability::Metrics::Instance().RecordCompactionDeleted(storage::common::StrategyDirectory(strategy_), report.deleted_objects);
  span.SetAttribute("deleted", static_cast<std::int64_t>(report.deleted_objects));

  if (report.deleted_objects > 0 || report.failures > 0) {
    CHECKPOINT_LOG_INFO("compaction finished",
                        {observability::IntField("deleted", static_cast<int64_t>(report.deleted_objects)),
                         observability::IntField("dropped_entries", static_cast<int64_t>(report.dropped_entries)),
                         observability::IntField("failures", static_cast<int64_t>(report.failures))});
  }
  return report;
}

std::map<std::string, uint64_t> Compactor::WorkerHorizons(const std::vector<ManifestEntry>& complete) {
  std::map<std::string, std::vector<uint64_t>> epochs;
  for (const auto& entry : complete) {
    for (const auto& record : entry.records()) {
      epochs[record.worker_id()].push_back(entry.epoch());
    }
  }

  std::map<std::string, uint64_t> horizons;
  for (auto& [worker_id, seen] : epochs) {
    std::sort(seen.begin(), seen.end());
    horizons[worker_id] = seen.size() == 1 ? seen.back() : seen[seen.size() - 2];
  }
  return horizons;
}

CompactionReport Compactor::CompactCoordinated() {
  CompactionReport report;

  auto horizons = WorkerHorizons(manifest_->CompletedEpochs());
  if (horizons.empty()) return report;

  uint64_t oldest_retained = UINT64_MAX;
  for (const auto& [worker_id, horizon] : horizons) {
    RemoveBelow(*store_, storage::common::WorkerPrefix(STRATEGY_COORDINATED, worker_id), horizon, report);
    oldest_retained = std::min(oldest_retained, horizon);
  }
  if (report.failures > 0) return report;

  size_t below = 0;
  for (auto epoch : manifest_->EpochNumbers()) {
    if (epoch < oldest_retained) ++below;
  }
  if (below > 0) {
    manifest_->DropEpochsBelow(oldest_retained);
    report.dropped_entries = below;
  }
  return report;
}

CompactionReport Compactor::CompactUncoordinated() {
  CompactionReport report;

  for (const auto& worker_id : manifest_->LocalWorkers()) {
    auto horizon = manifest_->LatestLocalSequence(worker_id);
    if (!horizon) continue;

    const auto failures_before = report.failures;
    RemoveBelow(*store_, storage::common::WorkerPrefix(STRATEGY_UNCOORDINATED, worker_id), *horizon, report);
    if (report.failures != failures_before) continue;

    auto records = manifest_->LocalRecords(worker_id);
    if (records.size() > 1) {
      manifest_->DropLocalBelow(worker_id, *horizon);
      report.dropped_entries += records.size() - 1;
    }
  }
  return report;
}

} // namespace checkpoint::compaction
