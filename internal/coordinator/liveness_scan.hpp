#pragma once

#include <cstddef>

#include "internal/coordinator/coordinator_mailbox.hpp"
#include "internal/coordinator/heartbeat_monitor.hpp"
#include "internal/util/time.hpp"

namespace checkpoint::coordinator {

/*
  One heartbeat scan: applies liveness transitions and forwards every
  DEAD declaration to the coordinator loop. Returns the number of workers
  declared DEAD.
*/
size_t ScanLiveness(HeartbeatMonitor& monitor, CoordinatorMailbox& mailbox, util::SteadyTimePoint now);

} // namespace checkpoint::coordinator
