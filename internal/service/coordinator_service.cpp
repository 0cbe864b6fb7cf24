#include "internal/service/coordinator_service.hpp"

#include <stdexcept>

#include "internal/coordinator/coordinator_loop.hpp"
#include "internal/coordinator/heartbeat_monitor.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace checkpoint::service {

using namespace checkpoint::manager::v1;

namespace {

void ValidateRecord(const SnapshotRecord& record) {
  if (record.worker_id().empty()) {
    throw std::invalid_argument("snapshot record requires a worker id");
  }
  if (record.storage_key().empty()) {
    throw std::invalid_argument("snapshot record requires a storage key");
  }
}

} // namespace

CoordinatorService::CoordinatorService(CoordinatorContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.monitor || !ctx_.mailbox || !ctx_.loop || !ctx_.recovery) {
    throw std::invalid_argument("coordinator service requires monitor, mailbox, loop and recovery manager");
  }
}

void CoordinatorService::Post(coordinator::CoordinatorEvent event) {
  if (!ctx_.mailbox->Post(std::move(event))) {
    throw util::InvalidState("coordinator is shutting down");
  }
}

RegisterWorkerResponse CoordinatorService::RegisterWorker(const RegisterWorkerRequest& req) {
  return ObserveRpc("CoordinatorService.RegisterWorker", req.worker_id(), [&] {
    if (req.advertise_address().empty() && ctx_.strategy == STRATEGY_COORDINATED) {
      throw std::invalid_argument("coordinated workers must advertise an address for barriers");
    }

    const auto previous = ctx_.monitor->Register(req.worker_id(), req.advertise_address(), util::SteadyNow());
    if (previous == WORKER_STATUS_DEAD) {
      Post(coordinator::WorkerRejoined{req.worker_id()});
    }

    CHECKPOINT_LOG_INFO("worker registered",
                        {observability::StringField("worker_id", req.worker_id()),
                         observability::StringField("address", req.advertise_address()),
                         observability::StringField("previous", WorkerStatus_Name(previous))});

    RegisterWorkerResponse resp;
    resp.set_strategy(ctx_.strategy);
    resp.set_snapshot_frequency_sec(ctx_.snapshot_frequency_sec);
    resp.set_heartbeat_interval_ms(ctx_.heartbeat_interval_ms);
    return resp;
  });
}

HeartbeatResponse CoordinatorService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("CoordinatorService.Heartbeat", req.worker_id(), [&] {
    const auto previous = ctx_.monitor->Heartbeat(req.worker_id(), util::SteadyNow());
    if (previous == WORKER_STATUS_DEAD) {
      CHECKPOINT_LOG_INFO("dead worker is alive again", {observability::StringField("worker_id", req.worker_id())});
      Post(coordinator::WorkerRejoined{req.worker_id()});
    }

    HeartbeatResponse resp;
    resp.set_status(WORKER_STATUS_ALIVE);
    return resp;
  });
}

void CoordinatorService::AckSnapshot(const AckSnapshotRequest& req) {
  ObserveRpc("CoordinatorService.AckSnapshot", req.record().worker_id(), [&] {
    if (ctx_.strategy != STRATEGY_COORDINATED) {
      throw util::InvalidState("coordinator is not running the coordinated strategy");
    }
    ValidateRecord(req.record());
    if (req.record().generation() != req.epoch()) {
      throw std::invalid_argument("ack epoch does not match record generation");
    }
    Post(coordinator::SnapshotAcked{req.epoch(), req.record()});
  });
}

void CoordinatorService::ReportLocalSnapshot(const ReportLocalSnapshotRequest& req) {
  ObserveRpc("CoordinatorService.ReportLocalSnapshot", req.record().worker_id(), [&] {
    if (ctx_.strategy != STRATEGY_UNCOORDINATED) {
      throw util::InvalidState("coordinator is not running the uncoordinated strategy");
    }
    ValidateRecord(req.record());
    if (req.record().strategy() != STRATEGY_UNCOORDINATED) {
      throw std::invalid_argument("local snapshot report requires an uncoordinated record");
    }
    Post(coordinator::LocalSnapshotReported{req.record()});
  });
}

GetRecoveryPointResponse CoordinatorService::GetRecoveryPoint(const GetRecoveryPointRequest& req) {
  return ObserveRpc("CoordinatorService.GetRecoveryPoint", req.worker_id(), [&] {
    auto point = ctx_.recovery->Current();

    GetRecoveryPointResponse resp;
    if (req.worker_id().empty()) {
      *resp.mutable_point() = std::move(point);
      return resp;
    }
    ctx_.recovery->MarkRecovered(req.worker_id());

    auto* filtered = resp.mutable_point();
    filtered->set_strategy(point.strategy());
    filtered->set_epoch(point.epoch());
    *filtered->add_workers() = recovery::RecoveryManager::PlanFor(point, req.worker_id());
    return resp;
  });
}

GetEpochStatusResponse CoordinatorService::GetEpochStatus(const GetEpochStatusRequest&) {
  return ObserveRpc("CoordinatorService.GetEpochStatus", {}, [&] {
    const auto view = ctx_.loop->Status();

    GetEpochStatusResponse resp;
    resp.set_current_epoch(view.current_epoch);
    resp.set_state(view.state);
    resp.set_latest_complete(view.latest_complete);
    resp.set_pending_duration_ms(view.pending_ms);
    for (const auto& worker_id : view.missing_acks) {
      resp.add_missing_acks(worker_id);
    }
    if (view.state != EPOCH_STATE_IDLE) {
      *resp.mutable_requested_at() = util::ToProto(view.requested_at);
    }
    return resp;
  });
}

} // namespace checkpoint::service
