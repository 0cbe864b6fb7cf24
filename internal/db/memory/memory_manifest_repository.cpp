#include "internal/db/memory/memory_manifest_repository.hpp"

#include "internal/db/memory/memory_tx.hpp"

namespace checkpoint::db::memory {

using namespace checkpoint::manager::v1;

MemoryManifestRepository::MemoryManifestRepository() = default;

std::unique_ptr<db::Transaction> MemoryManifestRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryManifestRepository::UpsertEpoch(Transaction& t, const ManifestEntry& entry) {
  TX(t).Mutable().epochs[entry.epoch()] = entry;
  return Result::Ok();
}

std::optional<ManifestEntry> MemoryManifestRepository::GetEpoch(Transaction& t, uint64_t epoch) {
  const auto& s  = TX(t).View();
  auto        it = s.epochs.find(epoch);
  if (it == s.epochs.end()) return std::nullopt;
  return it->second;
}

std::vector<ManifestEntry> MemoryManifestRepository::ListEpochs(Transaction& t) {
  std::vector<ManifestEntry> out;
  for (const auto& [_, entry] : TX(t).View().epochs) {
    out.push_back(entry);
  }
  return out;
}

Result MemoryManifestRepository::DeleteEpochsBelow(Transaction& t, uint64_t epoch) {
  auto& epochs = TX(t).Mutable().epochs;
  epochs.erase(epochs.begin(), epochs.lower_bound(epoch));
  return Result::Ok();
}

Result MemoryManifestRepository::InsertLocalRecord(Transaction& t, const SnapshotRecord& record) {
  auto& records = TX(t).Mutable().local[record.worker_id()];
  if (records.contains(record.generation())) return Result::Err(ErrorCode::AlreadyExists);
  records.emplace(record.generation(), record);
  return Result::Ok();
}

std::vector<SnapshotRecord> MemoryManifestRepository::ListLocalRecords(Transaction& t, const std::string& worker_id) {
  std::vector<SnapshotRecord> out;
  const auto&                 s  = TX(t).View();
  auto                        it = s.local.find(worker_id);
  if (it == s.local.end()) return out;
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  return out;
}

std::vector<std::string> MemoryManifestRepository::ListLocalWorkers(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [worker_id, records] : TX(t).View().local) {
    if (!records.empty()) out.push_back(worker_id);
  }
  return out;
}

Result MemoryManifestRepository::DeleteLocalRecordsBelow(Transaction& t, const std::string& worker_id, uint64_t generation) {
  auto& local = TX(t).Mutable().local;
  auto  it    = local.find(worker_id);
  if (it == local.end()) return Result::Ok();
  it->second.erase(it->second.begin(), it->second.lower_bound(generation));
  return Result::Ok();
}

} // namespace checkpoint::db::memory
