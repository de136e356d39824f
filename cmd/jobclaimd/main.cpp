#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/monitor/stale_claim_monitor.hpp"
#include "internal/observability/logging.hpp"

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

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
    std::cerr << "Usage: jobclaimd <config.yaml> OR jobclaimd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobclaim::config::ConfigLoader::LoadFromYaml(config_path);

    jobclaim::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build services and worker pools
    // ------------------------------------------------------------
    auto runtime = jobclaim::factory::BuildRuntime(config);
    auto pools   = jobclaim::factory::BuildPipelines(config, runtime);

    jobclaim::monitor::StaleClaimMonitor monitor(runtime.coordinator, jobclaim::factory::MonitorInterval(config));

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    for (auto& pool : pools) pool->Start();
    monitor.Start();
    JOBCLAIM_LOG_INFO("jobclaimd started", {IntField("pipelines", static_cast<int64_t>(pools.size())), StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    JOBCLAIM_LOG_INFO("shutting down jobclaimd");

    monitor.Stop();
    for (auto& pool : pools) pool->Stop();
    for (const auto& pool : pools) {
      auto stats = pool->Stats();
      JOBCLAIM_LOG_INFO("pipeline stopped", {StringField("queue", pool->Name()), IntField("processed", static_cast<int64_t>(stats.processed)),
                                             IntField("failed", static_cast<int64_t>(stats.failed)),
                                             IntField("skipped", static_cast<int64_t>(stats.skipped)),
                                             IntField("invalid", static_cast<int64_t>(stats.invalid))});
    }
    jobclaim::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    JOBCLAIM_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    jobclaim::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
