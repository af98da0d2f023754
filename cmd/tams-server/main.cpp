#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using tams::factory::Build;
using tams::runtime::Server;

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
    std::cerr << "Usage: tams-server <config.yaml> OR tams-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tams::config::ConfigLoader::LoadFromYaml(config_path);

    tams::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);
    app.StartBackground();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
      server.Start();
    } catch (const std::exception&) {
      app.StopBackground();
      throw;
    }
    TAMS_LOG_INFO("TAMS catalog started", {tams::observability::StringField("bind_address", config.server().bind_address()),
                                           tams::observability::StringField("version", config.service().version())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TAMS_LOG_INFO("Shutting down TAMS catalog");

    server.Stop();
    app.StopBackground();
    tams::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TAMS_LOG_ERROR("Fatal error", {tams::observability::StringField("error", e.what())});
    tams::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
