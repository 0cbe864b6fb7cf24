#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "checkpoint/manager/v1_types.hpp"

namespace checkpoint::coordinator {

struct EpochTick {};

struct SnapshotAcked {
  uint64_t                    epoch = 0;
  manager::v1::SnapshotRecord record;
};

struct LocalSnapshotReported {
  manager::v1::SnapshotRecord record;
};

struct WorkerDead {
  std::string worker_id;
};

struct WorkerRejoined {
  std::string worker_id;
};

using CoordinatorEvent = std::variant<EpochTick, SnapshotAcked, LocalSnapshotReported, WorkerDead, WorkerRejoined>;

/*
  Thread-safe blocking queue feeding the coordinator loop.

  Timers and RPC handlers only post here; the loop is the sole writer of
  epoch state.
*/
class CoordinatorMailbox {
 public:
  // Returns false once the mailbox is shut down.
  bool Post(CoordinatorEvent event);

  // blocking wait; nullopt after shutdown once drained
  std::optional<CoordinatorEvent> Dequeue();

  std::optional<CoordinatorEvent> TryDequeueFor(std::chrono::milliseconds wait);

  void Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::deque<CoordinatorEvent> queue_;
  bool                         shutdown_ = false;
};

} // namespace checkpoint::coordinator
