#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using vault::factory::Build;
using vault::runtime::Server;

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
    std::cerr << "Usage: archive-vault <config.yaml> OR archive-vault --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vault::config::ConfigLoader::LoadFromYaml(config_path);

    vault::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server and reaper
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), config.server().max_message_bytes(), app.grpc_services);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.reaper->Start();
    VAULT_LOG_INFO("archive-vault started", {vault::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VAULT_LOG_INFO("shutting down archive-vault");

    app.reaper->Stop();
    server.Shutdown();
    vault::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("fatal error", {vault::observability::StringField("error", e.what())});
    vault::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
