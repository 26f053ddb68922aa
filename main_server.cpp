#include "ledger_server.hpp"
#include "config/ledger_config.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

}  // namespace

int main(int argc, char* argv[]) {
  using recon::observability::LogLevel;

  // Usage: recon_ledger_server [config.json] [port]
  std::string config_path = argc >= 2 ? argv[1] : "config/ledger_config.json";

  recon::config::LedgerConfig config;
  try {
    config = recon::config::loadConfigFile(config_path);
    if (argc >= 3) config.server.port = std::stoi(argv[2]);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration " << config_path << ": " << e.what() << std::endl;
    return 1;
  }

  auto& logger = recon::observability::Logger::getInstance();
  if (auto level = recon::observability::parseLogLevel(config.logging.level)) {
    logger.setLogLevel(*level);
  } else {
    LOG_BUILDER(LogLevel::WARN, "Unknown log level, keeping default")
        .field("level", config.logging.level);
  }

  LOG_BUILDER(LogLevel::INFO, "Allocation & escalation ledger")
      .field("config", config_path)
      .field("port", config.server.port)
      .field("database", config.database.enabled);

  // Set up signal handling
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  try {
    recon::LedgerServer server(config, recon::createLedgerStore(config));

    if (!server.start()) {
      LOG_ERROR("Failed to start ledger server");
      return 1;
    }

    // Main server loop
    int ticks = 0;
    while (running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (++ticks % 60 != 0) continue;

      auto stats = server.getStats();
      LOG_BUILDER(LogLevel::INFO, "Server statistics")
          .field("active_connections", static_cast<uint64_t>(stats.active_connections))
          .field("notifications_delivered",
                 static_cast<uint64_t>(stats.notification_stats.delivered))
          .field("notifications_failed", static_cast<uint64_t>(stats.notification_stats.failed))
          .field("scheduled_runs", static_cast<uint64_t>(stats.scheduler_stats.runs))
          .field("scheduled_failures", static_cast<uint64_t>(stats.scheduler_stats.failures));
    }

    LOG_INFO("Shutdown requested");
    server.stop();
    LOG_BUILDER(LogLevel::DEBUG, "Final metrics")
        .field("prometheus", recon::observability::getGlobalMetrics().exportMetrics());
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::FATAL, "Server error").field("error", e.what());
    return 1;
  }

  LOG_INFO("Server shutdown complete");
  return 0;
}
