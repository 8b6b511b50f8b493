#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using fmd::factory::Build;

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
    std::cerr << "Usage: fmd-server <config.yaml> OR fmd-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fmd::config::ConfigLoader::LoadFromYaml(config_path);

    fmd::observability::InitializeMetrics(config);
    fmd::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph, schema check)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.gc_worker->Start();
    FMD_LOG_INFO("server", "fmd server started",
                 {fmd::observability::StringField("backend", fmd::config::DatabaseBackend(config)),
                  fmd::observability::IntField("gc_interval_sec", fmd::config::GcIntervalSec(config))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FMD_LOG_INFO("server", "Shutting down fmd server");

    app.gc_worker->Stop();
    fmd::observability::ShutdownLogging();
    fmd::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    FMD_LOG_ERROR("server", "Fatal error", {fmd::observability::StringField("error", e.what())});
    fmd::observability::ShutdownLogging();
    fmd::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
