#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using imc::factory::Build;
using imc::runtime::Server;

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
    std::cerr << "Usage: imc-controller <config.yaml> OR imc-controller --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = imc::config::ConfigLoader::LoadFromYaml(config_path);

    imc::observability::InitializeTracing(config);
    imc::observability::InitializeMetrics(config);
    imc::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.controller->Start(static_cast<int>(config.controller().workers()));

    std::unique_ptr<Server> server;
    if (!config.server().bind_address().empty()) {
      server = std::make_unique<Server>(config.server().bind_address(), std::move(app.grpc_services));
      server->Start();
    }

    IMC_LOG_INFO("Instance manager controller started", {imc::observability::StringField("controller", config.controller().controller_id()),
                                                         imc::observability::StringField("namespace", config.controller().namespace_())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    IMC_LOG_INFO("Shutting down instance manager controller");

    if (server) server->Stop();
    app.controller->Stop();
    imc::observability::ShutdownLogging();
    imc::observability::ShutdownMetrics();
    imc::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    IMC_LOG_ERROR("Fatal error", {imc::observability::StringField("error", e.what())});
    imc::observability::ShutdownLogging();
    imc::observability::ShutdownMetrics();
    imc::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
