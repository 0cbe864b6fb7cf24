#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using checkpoint::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  checkpoint::observability::ShutdownLogging();
  checkpoint::observability::ShutdownMetrics();
  checkpoint::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: checkpoint-coordinator <config.yaml> OR checkpoint-coordinator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = checkpoint::config::ConfigLoader::Load(config_path);

    checkpoint::observability::InitializeTracing(config, "coordinator");
    checkpoint::observability::InitializeMetrics(config, "coordinator");
    checkpoint::observability::InitializeLogging(config, "coordinator");

    // ------------------------------------------------------------
    // Build coordinator (manifest load + startup recovery gate)
    // ------------------------------------------------------------
    auto app = checkpoint::factory::BuildCoordinator(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.Start();
    CHECKPOINT_LOG_INFO("Checkpoint coordinator started",
                        {checkpoint::observability::StringField("bind_address", config.server().bind_address()),
                         checkpoint::observability::StringField("strategy", checkpoint::manager::v1::Strategy_Name(config.checkpoint().strategy()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHECKPOINT_LOG_INFO("Shutting down checkpoint coordinator");

    server.Stop();
    app.Stop();
    ShutdownObservability();
  } catch (const checkpoint::util::RecoveryInconsistency& e) {
    CHECKPOINT_LOG_ERROR("No usable recovery point", {checkpoint::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 3;
  } catch (const std::exception& e) {
    CHECKPOINT_LOG_ERROR("Fatal error", {checkpoint::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
