#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/util/backoff.hpp"
#include "internal/worker/coordinator_link.hpp"

namespace checkpoint::worker {

/*
  Delivers durable snapshot records to the coordinator from its own thread.

    coordinated record   → AckSnapshot(epoch, record)
    uncoordinated record → ReportLocalSnapshot(record), best effort

  Enqueue never blocks on the coordinator, so the snapshot writer and event
  processing keep going while it is slow or down.
*/
class SnapshotReporter {
 public:
  SnapshotReporter(std::shared_ptr<CoordinatorLink> link, util::RetryPolicy retry);
  ~SnapshotReporter();

  SnapshotReporter(const SnapshotReporter&)            = delete;
  SnapshotReporter& operator=(const SnapshotReporter&) = delete;

  void Enqueue(const manager::v1::SnapshotRecord& record);

  void Start();
  void Stop();

  size_t Backlog() const;

  size_t Delivered() const {
    return delivered_.load();
  }

 private:
  void Run();
  bool Deliver(const manager::v1::SnapshotRecord& record);

  std::shared_ptr<CoordinatorLink> link_;
  util::RetryPolicy                retry_;

  mutable std::mutex                      mutex_;
  std::condition_variable                 cv_;
  std::deque<manager::v1::SnapshotRecord> queue_;
  bool                                    stopping_ = false;

  std::atomic<size_t> delivered_{0};
  std::thread         thread_;
  std::atomic<bool>   running_{false};
};

} // namespace checkpoint::worker
