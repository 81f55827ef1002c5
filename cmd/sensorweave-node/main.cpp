#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/runtime/server.hpp"

using sensorweave::factory::Build;
using sensorweave::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  sensorweave::observability::ShutdownLogging();
  sensorweave::observability::ShutdownMetrics();
  sensorweave::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sensorweave-node <config.yaml> OR sensorweave-node --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sensorweave::config::ConfigLoader::LoadFromYaml(config_path);

    sensorweave::observability::InitializeTracing(config);
    sensorweave::observability::InitializeMetrics(config);
    sensorweave::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SENSORWEAVE_LOG_INFO("sensorweave node started", {sensorweave::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SENSORWEAVE_LOG_INFO("Shutting down sensorweave node");

    server.Stop();
    for (auto& worker : app.background_workers) {
      worker->Stop();
    }
    ShutdownObservability();
  } catch (const std::exception& e) {
    SENSORWEAVE_LOG_ERROR("Fatal error", {sensorweave::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
