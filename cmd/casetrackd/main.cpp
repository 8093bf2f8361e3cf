#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
    std::cerr << "Usage: casetrackd <config.yaml> OR casetrackd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = casetrack::config::ConfigLoader::LoadFromYaml(config_path);

    casetrack::observability::InitializeLogging(config);
    const bool metrics = casetrack::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = casetrack::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    for (auto& worker : app.background_workers) worker->Start();
    CASETRACK_LOG_INFO("casetrackd started", {casetrack::observability::StringField("config", config_path),
                                              casetrack::observability::IntField("workers", static_cast<int64_t>(app.background_workers.size())),
                                              casetrack::observability::BoolField("metrics", metrics)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CASETRACK_LOG_INFO("Shutting down casetrackd");

    for (auto& worker : app.background_workers) worker->Stop();
    casetrack::observability::ShutdownMetrics();
    casetrack::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CASETRACK_LOG_ERROR("Fatal error", {casetrack::observability::StringField("error", e.what())});
    casetrack::observability::ShutdownMetrics();
    casetrack::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
