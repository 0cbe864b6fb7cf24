#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/storage/snapshot_store.hpp"
#include "internal/util/backoff.hpp"
#include "internal/worker/partition_state_store.hpp"

namespace checkpoint::worker {

struct SnapshotTrigger {
  manager::v1::TriggerKind kind  = manager::v1::TRIGGER_LOCAL_TIMER;
  uint64_t                 epoch = 0;

  static SnapshotTrigger Coordinated(uint64_t epoch) {
    return {manager::v1::TRIGGER_COORDINATED_EPOCH, epoch};
  }

  static SnapshotTrigger Local() {
    return {manager::v1::TRIGGER_LOCAL_TIMER, 0};
  }
};

/*
  SnapshotEngine

      trigger ─► Capture (caller thread, brief state lock)
              ─► encode + CRC32C + Put with backoff (writer thread)
              ─► SnapshotRecord ─► completion sink

  Key and generation come from the trigger:
    coordinated epoch e  → coordinated/<worker>/<e>
    local timer          → uncoordinated/<worker>/<next sequence>

  The local sequence only advances when a write succeeds, so an exhausted
  retry leaves the previous snapshot as the worker's baseline.

  A capture or encode failure is a SerializationFailure and goes to the
  fatal handler: the worker cannot produce a usable image of itself.
*/
class SnapshotEngine {
 public:
  using CompletionSink = std::function<void(const manager::v1::SnapshotRecord&)>;
  using FatalHandler   = std::function<void(const std::exception&)>;

  SnapshotEngine(std::string worker_id, std::shared_ptr<SnapshotSource> source, storage::SnapshotStorePtr store, util::RetryPolicy retry,
                 uint64_t next_sequence = 1);
  ~SnapshotEngine();

  SnapshotEngine(const SnapshotEngine&)            = delete;
  SnapshotEngine& operator=(const SnapshotEngine&) = delete;

  void SetCompletionSink(CompletionSink sink);
  void SetFatalHandler(FatalHandler handler);

  void Start();
  void Stop();

  /*
    Synchronous snapshot. Returns nullopt when every write attempt failed.
    Throws util::SerializationFailure. Does not call the completion sink.
  */
  std::optional<manager::v1::SnapshotRecord> Snapshot(const SnapshotTrigger& trigger);

  /*
    Capture now and queue the write. Returns false for a barrier whose epoch
    is not above the last one accepted.
  */
  bool Submit(const SnapshotTrigger& trigger);

  // A captured image is waiting for or undergoing its write.
  bool InProgress() const {
    return pending_.load() > 0;
  }

  // Continue local numbering after the highest sequence already in the store.
  uint64_t ResumeSequence();

  uint64_t NextSequence() const;

  const std::string& WorkerId() const {
    return worker_id_;
  }

 private:
  struct Job {
    SnapshotTrigger trigger;
    CapturedState   state;
  };

  CapturedState                              CaptureOrThrow();
  std::optional<manager::v1::SnapshotRecord> Write(const Job& job);
  bool                                       PutWithRetry(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer);
  void                                       Run();

  std::string                     worker_id_;
  std::shared_ptr<SnapshotSource> source_;
  storage::SnapshotStorePtr       store_;
  util::RetryPolicy               retry_;

  // Serializes writes between Snapshot() and the writer thread.
  mutable std::mutex write_mutex_;
  uint64_t           next_sequence_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Job>         queue_;
  uint64_t                last_epoch_ = 0;
  bool                    stopping_   = false;

  CompletionSink sink_;
  FatalHandler   fatal_;

  std::atomic<size_t> pending_{0};
  std::thread         thread_;
  std::atomic<bool>   running_{false};
};

} // namespace checkpoint::worker
