#include <atomic>
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

using checkpoint::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

// Set by the snapshot writer when the worker cannot serialize its own state.
static std::atomic<bool> g_fatal{false};

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
    std::cerr << "Usage: checkpoint-worker <config.yaml> OR checkpoint-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = checkpoint::config::ConfigLoader::Load(config_path);

    checkpoint::observability::InitializeTracing(config, "worker");
    checkpoint::observability::InitializeMetrics(config, "worker");
    checkpoint::observability::InitializeLogging(config, "worker");

    // ------------------------------------------------------------
    // Register, restore, wire snapshot path
    // ------------------------------------------------------------
    auto app = checkpoint::factory::BuildWorker(config, [](const std::exception&) { g_fatal = true; });

    const auto& bind_address = config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.Start();
    CHECKPOINT_LOG_INFO("Checkpoint worker started",
                        {checkpoint::observability::StringField("worker_id", config.worker().worker_id()),
                         checkpoint::observability::StringField("bind_address", bind_address),
                         checkpoint::observability::StringField("strategy", checkpoint::manager::v1::Strategy_Name(config.checkpoint().strategy()))});

    while (g_running && !g_fatal) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    server.Stop();
    app.Stop();

    if (g_fatal) {
      // Non-zero exit hands the worker to its supervisor for a restart.
      CHECKPOINT_LOG_ERROR("Worker state could not be serialized, exiting for restart");
      ShutdownObservability();
      return 4;
    }

    CHECKPOINT_LOG_INFO("Shutting down checkpoint worker");
    ShutdownObservability();
  } catch (const std::exception& e) {
    CHECKPOINT_LOG_ERROR("Fatal error", {checkpoint::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
