#include "client/cpp/coordinator_client.h"

#include <grpcpp/client_context.h>

#include <string>
#include <string_view>

namespace checkpoint::manager::client {

using namespace checkpoint::manager::v1;

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

} // namespace

CoordinatorClient::CoordinatorClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(CheckpointCoordinatorService::NewStub(channel)), deadline_(deadline) {
}

arrow::Result<RegisterWorkerResponse> CoordinatorClient::RegisterWorker(const std::string& worker_id, const std::string& advertise_address) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  RegisterWorkerRequest req;
  req.set_worker_id(worker_id);
  req.set_advertise_address(advertise_address);

  RegisterWorkerResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->RegisterWorker(&ctx, req, &resp), "RegisterWorker"));
  return resp;
}

arrow::Result<WorkerStatus> CoordinatorClient::Heartbeat(const std::string& worker_id) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  HeartbeatRequest req;
  req.set_worker_id(worker_id);

  HeartbeatResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Heartbeat(&ctx, req, &resp), "Heartbeat"));
  return resp.status();
}

arrow::Status CoordinatorClient::AckSnapshot(uint64_t epoch, const SnapshotRecord& record) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  AckSnapshotRequest req;
  req.set_epoch(epoch);
  *req.mutable_record() = record;

  google::protobuf::Empty resp;
  return GrpcToArrow(stub_->AckSnapshot(&ctx, req, &resp), "AckSnapshot");
}

arrow::Status CoordinatorClient::ReportLocalSnapshot(const SnapshotRecord& record) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  ReportLocalSnapshotRequest req;
  *req.mutable_record() = record;

  google::protobuf::Empty resp;
  return GrpcToArrow(stub_->ReportLocalSnapshot(&ctx, req, &resp), "ReportLocalSnapshot");
}

arrow::Result<RecoveryPoint> CoordinatorClient::GetRecoveryPoint(const std::string& worker_id) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  GetRecoveryPointRequest req;
  req.set_worker_id(worker_id);

  GetRecoveryPointResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetRecoveryPoint(&ctx, req, &resp), "GetRecoveryPoint"));
  return resp.point();
}

arrow::Result<GetEpochStatusResponse> CoordinatorClient::GetEpochStatus() const {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  GetEpochStatusRequest  req;
  GetEpochStatusResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetEpochStatus(&ctx, req, &resp), "GetEpochStatus"));
  return resp;
}

} // namespace checkpoint::manager::client
