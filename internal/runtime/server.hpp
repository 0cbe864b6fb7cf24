#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace checkpoint::runtime {

/*
  gRPC listener shared by the coordinator and the worker.

  Owns the service adapters registered on it and exposes the standard
  grpc.health.v1 service so orchestration can probe either process.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();

  // In-flight calls get `grace` to finish before they are cancelled.
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  // Port actually bound; resolves ":0" listeners.
  int Port() const {
    return selected_port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace checkpoint::runtime
