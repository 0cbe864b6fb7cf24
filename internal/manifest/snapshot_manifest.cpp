#include "internal/manifest/snapshot_manifest.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace checkpoint::manifest {

using namespace checkpoint::manager::v1;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

bool IsTerminal(EpochState state) {
  return state == EPOCH_STATE_COMPLETE || state == EPOCH_STATE_INCOMPLETE;
}

SnapshotManifest::SnapshotManifest(std::shared_ptr<db::ManifestRepository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("snapshot manifest requires a repository");
  }
}

void SnapshotManifest::Load() {
  auto tx     = repository_->Begin();
  auto epochs = repository_->ListEpochs(*tx);

  std::map<std::string, std::map<uint64_t, SnapshotRecord>> local;
  for (const auto& worker_id : repository_->ListLocalWorkers(*tx)) {
    for (auto& record : repository_->ListLocalRecords(*tx, worker_id)) {
      local[worker_id].emplace(record.generation(), std::move(record));
    }
  }
  tx->Commit();

  std::unique_lock lock(mutex_);
  epochs_.clear();
  for (auto& entry : epochs) {
    epochs_.emplace(entry.epoch(), std::move(entry));
  }
  local_ = std::move(local);
}

bool SnapshotManifest::Empty() const {
  std::shared_lock lock(mutex_);
  if (!epochs_.empty()) return false;
  for (const auto& [_, records] : local_) {
    if (!records.empty()) return false;
  }
  return true;
}

uint64_t SnapshotManifest::MaxEpoch() const {
  std::shared_lock lock(mutex_);
  return epochs_.empty() ? 0 : epochs_.rbegin()->first;
}

void SnapshotManifest::PutEpoch(const ManifestEntry& entry) {
  std::unique_lock lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertEpoch(*tx, entry), "put epoch " + std::to_string(entry.epoch()));
  tx->Commit();

  epochs_[entry.epoch()] = entry;
}

std::optional<ManifestEntry> SnapshotManifest::Epoch(uint64_t epoch) const {
  std::shared_lock lock(mutex_);
  auto             it = epochs_.find(epoch);
  if (it == epochs_.end()) return std::nullopt;
  return it->second;
}

std::vector<ManifestEntry> SnapshotManifest::CompletedEpochs() const {
  std::shared_lock           lock(mutex_);
  std::vector<ManifestEntry> out;
  for (const auto& [_, entry] : epochs_) {
    if (entry.state() == EPOCH_STATE_COMPLETE) out.push_back(entry);
  }
  return out;
}

std::vector<ManifestEntry> SnapshotManifest::PendingEpochs() const {
  std::shared_lock           lock(mutex_);
  std::vector<ManifestEntry> out;
  for (const auto& [_, entry] : epochs_) {
    if (!IsTerminal(entry.state())) out.push_back(entry);
  }
  return out;
}

std::vector<uint64_t> SnapshotManifest::EpochNumbers() const {
  std::shared_lock      lock(mutex_);
  std::vector<uint64_t> out;
  out.reserve(epochs_.size());
  for (const auto& [epoch, _] : epochs_) {
    out.push_back(epoch);
  }
  return out;
}

void SnapshotManifest::DropEpochsBelow(uint64_t epoch) {
  std::unique_lock lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteEpochsBelow(*tx, epoch), "drop epochs below " + std::to_string(epoch));
  tx->Commit();

  epochs_.erase(epochs_.begin(), epochs_.lower_bound(epoch));
}

void SnapshotManifest::AppendLocal(const SnapshotRecord& record) {
  if (record.worker_id().empty()) {
    throw std::invalid_argument("local snapshot record requires a worker id");
  }

  std::unique_lock lock(mutex_);

  auto& records = local_[record.worker_id()];
  if (!records.empty() && record.generation() <= records.rbegin()->first) {
    auto existing = records.find(record.generation());
    if (existing != records.end() && google::protobuf::util::MessageDifferencer::Equals(existing->second, record)) {
      return;
    }
    throw util::InvalidState("local snapshot sequence " + std::to_string(record.generation()) + " for worker " + record.worker_id() +
                             " is not above " + std::to_string(records.rbegin()->first));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertLocalRecord(*tx, record), "append local snapshot for " + record.worker_id());
  tx->Commit();

  records.emplace(record.generation(), record);
}

std::vector<std::string> SnapshotManifest::LocalWorkers() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [worker_id, records] : local_) {
    if (!records.empty()) out.push_back(worker_id);
  }
  return out;
}

std::vector<SnapshotRecord> SnapshotManifest::LocalRecords(const std::string& worker_id) const {
  std::shared_lock            lock(mutex_);
  std::vector<SnapshotRecord> out;
  auto                        it = local_.find(worker_id);
  if (it == local_.end()) return out;
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  return out;
}

std::optional<uint64_t> SnapshotManifest::LatestLocalSequence(const std::string& worker_id) const {
  std::shared_lock lock(mutex_);
  auto             it = local_.find(worker_id);
  if (it == local_.end() || it->second.empty()) return std::nullopt;
  return it->second.rbegin()->first;
}

void SnapshotManifest::DropLocalBelow(const std::string& worker_id, uint64_t generation) {
  std::unique_lock lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteLocalRecordsBelow(*tx, worker_id, generation), "drop local snapshots for " + worker_id);
  tx->Commit();

  auto it = local_.find(worker_id);
  if (it == local_.end()) return;
  it->second.erase(it->second.begin(), it->second.lower_bound(generation));
}

} // namespace checkpoint::manifest
