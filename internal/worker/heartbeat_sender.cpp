#include "internal/worker/heartbeat_sender.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

HeartbeatSender::HeartbeatSender(std::shared_ptr<CoordinatorLink> link, std::string worker_id, std::string advertise_address,
                                 std::chrono::milliseconds interval)
    : link_(std::move(link)),
      worker_id_(std::move(worker_id)),
      advertise_address_(std::move(advertise_address)),
      task_("heartbeat", interval, [this] {
        auto status = Tick();
        if (!status.ok()) {
          CHECKPOINT_LOG_WARN("heartbeat failed", {observability::StringField("worker_id", worker_id_), observability::StringField("error", status.ToString())});
        }
      }) {
  if (!link_) {
    throw std::invalid_argument("heartbeat sender requires a coordinator link");
  }
}

arrow::Result<RegisterWorkerResponse> HeartbeatSender::Register() {
  auto response = link_->RegisterWorker(worker_id_, advertise_address_);
  if (response.ok()) {
    registered_ = true;
    CHECKPOINT_LOG_INFO("registered with coordinator",
                        {observability::StringField("worker_id", worker_id_),
                         observability::StringField("strategy", Strategy_Name(response->strategy()))});
  }
  return response;
}

void HeartbeatSender::Start() {
  task_.Start();
}

void HeartbeatSender::Stop() {
  task_.Stop();
}

arrow::Status HeartbeatSender::Tick() {
  if (!registered_) {
    ARROW_RETURN_NOT_OK(Register().status());
  }

  auto status = link_->Heartbeat(worker_id_);
  if (status.status().IsKeyError()) {
    CHECKPOINT_LOG_WARN("coordinator does not know this worker, registering again", {observability::StringField("worker_id", worker_id_)});
    registered_ = false;
    return Register().status();
  }
  return status.status();
}

} // namespace checkpoint::worker
