#include "internal/coordinator/heartbeat_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/coordinator/coordinator_mailbox.hpp"
#include "internal/coordinator/liveness_scan.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using checkpoint::coordinator::CoordinatorMailbox;
using checkpoint::coordinator::HeartbeatMonitor;
using checkpoint::coordinator::WorkerDead;
using namespace checkpoint::manager::v1;

const auto kStart = checkpoint::util::SteadyTimePoint{} + 1h;

void TestSilentWorkerIsDeadAfterLimitNeverEarlier() {
  HeartbeatMonitor monitor(5000ms);
  monitor.Register("w-1", "w-1:7200", kStart);

  monitor.Scan(kStart + 2000ms);
  assert(monitor.Status("w-1") == WORKER_STATUS_ALIVE);

  monitor.Scan(kStart + 5000ms);
  assert(monitor.Status("w-1") != WORKER_STATUS_DEAD);

  auto transitions = monitor.Scan(kStart + 5001ms);
  assert(monitor.Status("w-1") == WORKER_STATUS_DEAD);
  assert(transitions.size() == 1);
  assert(transitions[0].to == WORKER_STATUS_DEAD);
}

void TestSubMillisecondOverrunIsDead() {
  HeartbeatMonitor monitor(5000ms);
  monitor.Register("w-1", "", kStart);

  monitor.Scan(kStart + 5000ms);
  assert(monitor.Status("w-1") != WORKER_STATUS_DEAD);

  auto transitions = monitor.Scan(kStart + 5000ms + 900us);
  assert(monitor.Status("w-1") == WORKER_STATUS_DEAD);
  assert(transitions.size() == 1);
}

void TestSuspectAfterHalfTheLimit() {
  HeartbeatMonitor monitor(5000ms);
  monitor.Register("w-1", "", kStart);

  auto transitions = monitor.Scan(kStart + 2600ms);
  assert(transitions.size() == 1);
  assert(transitions[0].from == WORKER_STATUS_ALIVE);
  assert(transitions[0].to == WORKER_STATUS_SUSPECT);

  // Suspects still count for epochs.
  assert(monitor.AliveWorkers().size() == 1);
}

void TestSixSecondsSilenceThenHeartbeatsResume() {
  HeartbeatMonitor monitor(5000ms);
  monitor.Register("w-1", "", kStart);

  // 500ms check interval
  for (auto t = 500ms; t <= 6000ms; t += 500ms) {
    monitor.Scan(kStart + t);
  }
  assert(monitor.Status("w-1") == WORKER_STATUS_DEAD);
  assert(monitor.AliveWorkers().empty());

  const auto previous = monitor.Heartbeat("w-1", kStart + 6100ms);
  assert(previous == WORKER_STATUS_DEAD);

  monitor.Scan(kStart + 6500ms);
  assert(monitor.Status("w-1") == WORKER_STATUS_ALIVE);
}

void TestDeadWorkerStaysDeadUntilHeard() {
  HeartbeatMonitor monitor(1000ms);
  monitor.Register("w-1", "", kStart);
  monitor.Scan(kStart + 1500ms);

  assert(monitor.Scan(kStart + 3000ms).empty());
  assert(monitor.Status("w-1") == WORKER_STATUS_DEAD);

  assert(monitor.Register("w-1", "w-1:7201", kStart + 3100ms) == WORKER_STATUS_DEAD);
  assert(monitor.Status("w-1") == WORKER_STATUS_ALIVE);
  assert(monitor.Address("w-1") == std::string("w-1:7201"));
}

void TestHeartbeatFromUnknownWorkerThrows() {
  HeartbeatMonitor monitor(1000ms);
  bool             thrown = false;
  try {
    monitor.Heartbeat("ghost", kStart);
  } catch (const checkpoint::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
  assert(!monitor.Status("ghost").has_value());
}

void TestScanForwardsDeadWorkersToMailbox() {
  HeartbeatMonitor   monitor(1000ms);
  CoordinatorMailbox mailbox;
  monitor.Register("w-1", "", kStart);
  monitor.Register("w-2", "", kStart);
  monitor.Heartbeat("w-2", kStart + 900ms);

  const auto dead = checkpoint::coordinator::ScanLiveness(monitor, mailbox, kStart + 1200ms);
  assert(dead == 1);
  assert(mailbox.Size() == 1);

  auto event = mailbox.TryDequeueFor(0ms);
  assert(event.has_value());
  assert(std::get<WorkerDead>(*event).worker_id == "w-1");
}

} // namespace

int main() {
  TestSilentWorkerIsDeadAfterLimitNeverEarlier();
  TestSubMillisecondOverrunIsDead();
  TestSuspectAfterHalfTheLimit();
  TestSixSecondsSilenceThenHeartbeatsResume();
  TestDeadWorkerStaysDeadUntilHeard();
  TestHeartbeatFromUnknownWorkerThrows();
  TestScanForwardsDeadWorkersToMailbox();

  std::cout << "checkpoint_unit_heartbeat_monitor: pass\n";
  return 0;
}
