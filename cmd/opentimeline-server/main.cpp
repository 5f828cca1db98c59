#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/runtime/server.hpp"

using opentimeline::runtime::Server;

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
    std::cerr << "Usage: opentimeline-server <config.yaml> OR opentimeline-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = opentimeline::config::ConfigLoader::LoadFromYaml(config_path);

    opentimeline::observability::InitializeTracing(config);
    opentimeline::observability::InitializeMetrics(config);
    opentimeline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = opentimeline::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50061" : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    OPENTIMELINE_LOG_INFO("OpenTimeline server started", {opentimeline::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OPENTIMELINE_LOG_INFO("Shutting down OpenTimeline server");

    server.Stop();
    opentimeline::observability::ShutdownLogging();
    opentimeline::observability::ShutdownMetrics();
    opentimeline::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    OPENTIMELINE_LOG_ERROR("Fatal error", {opentimeline::observability::StringField("error", e.what())});
    opentimeline::observability::ShutdownLogging();
    opentimeline::observability::ShutdownMetrics();
    opentimeline::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
