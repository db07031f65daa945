#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconcile/reconciliation_worker.hpp"
#include "internal/runtime/server.hpp"

using scanhub::factory::Build;
using scanhub::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  scanhub::observability::ShutdownLogging();
  scanhub::observability::ShutdownMetrics();
  scanhub::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: scanhub <config.yaml> OR scanhub --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = scanhub::config::ConfigLoader::LoadFromYaml(config_path);

    scanhub::observability::InitializeTracing(config);
    scanhub::observability::InitializeMetrics(config);
    scanhub::observability::InitializeLogging(config);

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
    SCANHUB_LOG_INFO("scanhub started", {scanhub::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SCANHUB_LOG_INFO("shutting down scanhub");

    // streams close first so no new pairing is committed while workers stop
    server.Stop();
    for (auto& worker : app.background_workers) {
      worker->Stop();
    }

    ShutdownObservability();
  } catch (const std::exception& e) {
    SCANHUB_LOG_ERROR("Fatal error", {scanhub::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
