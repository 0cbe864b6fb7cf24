#include "internal/grpc/coordinator_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace checkpoint::grpc {

using namespace checkpoint::manager::v1;

CoordinatorServer::CoordinatorServer(std::shared_ptr<checkpoint::service::CoordinatorService> svc) : service_(std::move(svc)) {
}

::grpc::Status CoordinatorServer::RegisterWorker(::grpc::ServerContext*, const RegisterWorkerRequest* req, RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::Heartbeat(::grpc::ServerContext*, const HeartbeatRequest* req, HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::AckSnapshot(::grpc::ServerContext*, const AckSnapshotRequest* req, google::protobuf::Empty*) {
  try {
    service_->AckSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::ReportLocalSnapshot(::grpc::ServerContext*, const ReportLocalSnapshotRequest* req, google::protobuf::Empty*) {
  try {
    service_->ReportLocalSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::GetRecoveryPoint(::grpc::ServerContext*, const GetRecoveryPointRequest* req, GetRecoveryPointResponse* resp) {
  try {
    *resp = service_->GetRecoveryPoint(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoordinatorServer::GetEpochStatus(::grpc::ServerContext*, const GetEpochStatusRequest* req, GetEpochStatusResponse* resp) {
  try {
    *resp = service_->GetEpochStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace checkpoint::grpc
