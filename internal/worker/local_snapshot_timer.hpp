#pragma once

#include <chrono>
#include <memory>

#include "internal/runtime/periodic_task.hpp"
#include "internal/worker/snapshot_engine.hpp"

namespace checkpoint::worker {

/*
  Uncoordinated trigger: one timer per worker, no coordinator involved.
  A tick is skipped while the previous snapshot is still being written.
*/
class LocalSnapshotTimer {
 public:
  LocalSnapshotTimer(std::shared_ptr<SnapshotEngine> engine, std::chrono::milliseconds frequency);

  void Start();
  void Stop();

  // One timer tick. Returns true when a snapshot was submitted.
  bool Tick();

 private:
  std::shared_ptr<SnapshotEngine> engine_;
  runtime::PeriodicTask           task_;
};

} // namespace checkpoint::worker
