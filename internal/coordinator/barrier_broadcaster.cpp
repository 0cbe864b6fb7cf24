#include "internal/coordinator/barrier_broadcaster.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::coordinator {

using namespace checkpoint::manager::v1;

GrpcBarrierBroadcaster::GrpcBarrierBroadcaster(std::shared_ptr<HeartbeatMonitor> monitor, std::chrono::milliseconds deadline)
    : monitor_(std::move(monitor)), deadline_(deadline) {
  if (!monitor_) {
    throw std::invalid_argument("barrier broadcaster requires a heartbeat monitor");
  }
}

CheckpointWorkerService::Stub* GrpcBarrierBroadcaster::StubFor(const std::string& address) {
  std::lock_guard lock(mutex_);
  auto            it = stubs_.find(address);
  if (it == stubs_.end()) {
    auto channel = ::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials());
    it           = stubs_.emplace(address, CheckpointWorkerService::NewStub(channel)).first;
  }
  return it->second.get();
}

size_t GrpcBarrierBroadcaster::Broadcast(uint64_t epoch, const std::vector<std::string>& workers) {
  size_t accepted = 0;

  SnapshotBarrier barrier;
  barrier.set_epoch(epoch);

  for (const auto& worker_id : workers) {
    auto address = monitor_->Address(worker_id);
    if (!address || address->empty()) {
      CHECKPOINT_LOG_WARN("no address for worker, barrier not sent",
                          {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                           observability::StringField("worker_id", worker_id)});
      continue;
    }

    ::grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    SnapshotBarrierResponse response;
    const auto              status = StubFor(*address)->RequestSnapshot(&context, barrier, &response);
    if (!status.ok()) {
      CHECKPOINT_LOG_WARN("barrier delivery failed",
                          {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                           observability::StringField("worker_id", worker_id),
                           observability::StringField("address", *address),
                           observability::StringField("error", status.error_message())});
      continue;
    }
    if (!response.accepted()) {
      CHECKPOINT_LOG_WARN("barrier rejected by worker",
                          {observability::IntField("epoch", static_cast<int64_t>(epoch)),
                           observability::StringField("worker_id", worker_id)});
      continue;
    }
    ++accepted;
  }
  return accepted;
}

} // namespace checkpoint::coordinator
