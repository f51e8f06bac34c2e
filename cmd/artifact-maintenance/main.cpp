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

using artifact::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: artifact-maintenance <config.yaml> OR artifact-maintenance --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = artifact::config::ConfigLoader::LoadFromYaml(config_path);

    artifact::observability::InitializeTracing(config);
    artifact::observability::InitializeMetrics(config);
    artifact::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = artifact::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ARTIFACT_LOG_INFO("Artifact maintenance started", {artifact::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ARTIFACT_LOG_INFO("Shutting down artifact maintenance");

    server.Stop();
    artifact::observability::ShutdownLogging();
    artifact::observability::ShutdownMetrics();
    artifact::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ARTIFACT_LOG_ERROR("Fatal error", {artifact::observability::ErrorField(e)});
    artifact::observability::ShutdownLogging();
    artifact::observability::ShutdownMetrics();
    artifact::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
