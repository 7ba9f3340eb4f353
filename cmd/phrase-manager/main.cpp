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

using phrase::factory::Build;
using phrase::runtime::Server;

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
    std::cerr << "Usage: phrase-manager <config.yaml> OR phrase-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = phrase::config::ConfigLoader::LoadFromYaml(config_path);

    phrase::observability::InitializeTracing(config);
    phrase::observability::InitializeMetrics(config);
    phrase::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50051" : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PHRASE_LOG_INFO("Phrase manager started", {phrase::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PHRASE_LOG_INFO("Shutting down phrase manager");

    server.Stop();
    phrase::observability::ShutdownLogging();
    phrase::observability::ShutdownMetrics();
    phrase::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PHRASE_LOG_ERROR("Fatal error", {phrase::observability::StringField("error", e.what())});
    phrase::observability::ShutdownLogging();
    phrase::observability::ShutdownMetrics();
    phrase::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
