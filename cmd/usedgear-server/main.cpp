#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/market_service.hpp"

using usedgear::factory::Build;
using usedgear::runtime::Server;

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
    std::cerr << "Usage: usedgear-server <config.yaml> OR usedgear-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = usedgear::config::ConfigLoader::LoadFromYaml(config_path);

    usedgear::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), app.service);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    USEDGEAR_LOG_INFO("Shutting down usedgear");

    server.Stop();
    // Persist where the market stands so the next start resumes it.
    app.service->SaveSnapshot({});
    usedgear::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    USEDGEAR_LOG_ERROR("Fatal error", {usedgear::observability::StringField("error", e.what())});
    usedgear::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
