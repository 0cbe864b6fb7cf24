#include "internal/runtime/server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
  if (bind_address_.empty()) {
    throw std::invalid_argument("server bind address must not be empty");
  }
}

Server::~Server() {
  Stop(std::chrono::milliseconds(0));
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("server already started on " + bind_address_);
  }

  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to listen on " + bind_address_);
  }

  CHECKPOINT_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                                observability::IntField("port", selected_port_),
                                                observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop(std::chrono::milliseconds grace) {
  if (!grpc_server_) {
    return;
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + grace);
  grpc_server_.reset();
  CHECKPOINT_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace checkpoint::runtime
