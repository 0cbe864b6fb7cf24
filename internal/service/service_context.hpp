#pragma once

#include <cstdint>
#include <memory>

#include "checkpoint/manager/v1_types.hpp"

namespace checkpoint::coordinator {
class HeartbeatMonitor;
class CoordinatorMailbox;
class CoordinatorLoop;
} // namespace checkpoint::coordinator
namespace checkpoint::recovery {
class RecoveryManager;
}
namespace checkpoint::worker {
class SnapshotEngine;
}

namespace checkpoint::service {

/*
  Dependency container shared by the coordinator service.
*/
struct CoordinatorContext {
  manager::v1::Strategy strategy{manager::v1::STRATEGY_COORDINATED};
  uint32_t              snapshot_frequency_sec{0};
  uint32_t              heartbeat_interval_ms{0};

  std::shared_ptr<coordinator::HeartbeatMonitor>   monitor;
  std::shared_ptr<coordinator::CoordinatorMailbox> mailbox;
  std::shared_ptr<coordinator::CoordinatorLoop>    loop;
  std::shared_ptr<recovery::RecoveryManager>       recovery;
};

struct WorkerContext {
  manager::v1::Strategy                   strategy{manager::v1::STRATEGY_COORDINATED};
  std::shared_ptr<worker::SnapshotEngine> engine;
};

} // namespace checkpoint::service
