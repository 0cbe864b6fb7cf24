#include "internal/worker/state_restorer.hpp"

#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/snapshot_codec.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

bool ApplyEvent(PartitionStateStore& state, const LogEvent& event) {
  if (event.value) {
    return state.Apply(event.partition, event.key, *event.value, event.offset);
  }
  return state.Erase(event.partition, event.key, event.offset);
}

StateRestorer::StateRestorer(storage::SnapshotStorePtr store, std::shared_ptr<EventLog> event_log)
    : store_(std::move(store)), event_log_(std::move(event_log)) {
  if (!store_ || !event_log_) {
    throw std::invalid_argument("state restorer requires a snapshot store and an event log");
  }
}

RestoreResult StateRestorer::Restore(const WorkerRecoveryPlan& plan, PartitionStateStore& state, const std::vector<std::string>& partitions) {
  RestoreResult result;

  std::vector<PartitionOffset> offsets(plan.replay_from().begin(), plan.replay_from().end());
  PartitionImage               image;

  if (plan.has_snapshot()) {
    const auto& record = plan.record();
    std::shared_ptr<arrow::Buffer> blob;
    try {
      blob = store_->Get(record.storage_key());
    } catch (const util::NotFound& e) {
      throw util::RecoveryInconsistency("recovery snapshot missing: " + std::string(e.what()));
    }

    if (static_cast<uint64_t>(blob->size()) != record.size_bytes() ||
        util::Crc32c::Compute(blob->data(), static_cast<size_t>(blob->size())) != record.checksum()) {
      throw util::RecoveryInconsistency("recovery snapshot does not match its record: " + record.storage_key());
    }

    try {
      image = DecodeSnapshot(*blob).image;
    } catch (const util::SerializationFailure& e) {
      throw util::RecoveryInconsistency("recovery snapshot undecodable: " + std::string(e.what()));
    }

    result.from_snapshot = true;
    result.generation    = record.generation();
  }

  // Owned partitions missing from the plan start at offset 0.
  std::set<std::string> known;
  for (const auto& offset : offsets) {
    known.insert(offset.partition());
  }
  for (const auto& partition : partitions) {
    if (known.count(partition) != 0) continue;
    PartitionOffset offset;
    offset.set_partition(partition);
    offset.set_offset(0);
    offsets.push_back(std::move(offset));
  }

  state.Restore(image, offsets);

  for (const auto& offset : offsets) {
    result.replayed += event_log_->Replay(offset.partition(), offset.offset(), [&](const LogEvent& event) { ApplyEvent(state, event); });
  }

  CHECKPOINT_LOG_INFO("worker state restored",
                      {observability::StringField("worker_id", plan.worker_id()),
                       observability::BoolField("from_snapshot", result.from_snapshot),
                       observability::IntField("generation", static_cast<int64_t>(result.generation)),
                       observability::IntField("replayed", static_cast<int64_t>(result.replayed))});
  return result;
}

std::optional<WorkerRecoveryPlan> StateRestorer::LatestLocalPlan(const std::string& worker_id) {
  auto keys = store_->List(storage::common::WorkerPrefix(STRATEGY_UNCOORDINATED, worker_id));

  for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
    if (!storage::common::ParseSnapshotKey(*it)) continue;

    std::shared_ptr<arrow::Buffer> blob;
    DecodedSnapshot                decoded;
    try {
      blob    = store_->Get(*it);
      decoded = DecodeSnapshot(*blob);
    } catch (const util::NotFound&) {
      continue;
    } catch (const util::SerializationFailure& e) {
      CHECKPOINT_LOG_WARN("skipping undecodable local snapshot", {observability::StringField("key", *it), observability::StringField("error", e.what())});
      continue;
    }

    WorkerRecoveryPlan plan;
    plan.set_worker_id(worker_id);
    plan.set_has_snapshot(true);

    auto* record = plan.mutable_record();
    record->set_worker_id(worker_id);
    record->set_strategy(STRATEGY_UNCOORDINATED);
    record->set_generation(decoded.header.generation());
    *record->mutable_created_at() = decoded.header.created_at();
    record->set_storage_key(*it);
    record->set_size_bytes(static_cast<uint64_t>(blob->size()));
    record->set_checksum(util::Crc32c::Compute(blob->data(), static_cast<size_t>(blob->size())));
    *record->mutable_offsets()  = decoded.header.offsets();
    *plan.mutable_replay_from() = decoded.header.offsets();
    return plan;
  }
  return std::nullopt;
}

uint64_t StateRestorer::CatchUp(PartitionStateStore& state, const std::vector<std::string>& partitions) {
  uint64_t applied = 0;
  for (const auto& partition : partitions) {
    event_log_->Replay(partition, state.NextOffset(partition), [&](const LogEvent& event) {
      if (ApplyEvent(state, event)) ++applied;
    });
  }
  return applied;
}

} // namespace checkpoint::worker
