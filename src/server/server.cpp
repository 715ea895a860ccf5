#include <simlens/server/server.hpp>
#include <simlens/server/handlers.hpp>
#include <simlens/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iostream>
#include <thread>

namespace simlens::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  // Validate configuration
  config_.Validate();

  auto oracle = std::make_shared<OracleClient>(config_.semantic.oracle);
  comparator_ = std::make_shared<Comparator>(std::move(oracle));
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupRoutes() {
  // Create shared metrics if enabled
  std::shared_ptr<ServiceMetrics> metrics;
  if (config_.metrics.enabled) {
    metrics = std::make_shared<ServiceMetrics>();
  }

  // Register all handlers
  workers_ = std::make_shared<trantor::ConcurrentTaskQueue>(config_.server.workers,
                                                             "simlens-compare");
  RegisterHandlers(comparator_, config_, metrics, workers_);

  // Register metrics endpoint if enabled
  if (metrics) {
    RegisterMetricsHandler(metrics, config_.metrics.path);
  }
}

void Server::Run() {
  running_ = true;

  // Configure Drogon
  auto& app = drogon::app();
  app.setLogLevel(ToLogLevel(config_.server.log_level));

  // Set listener address and port
  app.addListener(config_.server.host, config_.server.port);

  // Set number of threads
  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  // Configure timeouts and limits
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);

  // Disable session support (not needed for API server)
  app.disableSession();

  // Set up routes
  SetupRoutes();

  std::cout << "Simlens server starting on " << config_.server.host
            << ":" << config_.server.port << " with " << threads << " threads and "
            << config_.server.workers << " comparison workers" << std::endl;

  if (comparator_->oracle().IsConfigured()) {
    std::cout << "Semantic oracle: " << config_.semantic.oracle.model
              << (config_.semantic.enrich ? "" : " (on request only)") << std::endl;
  } else {
    std::cout << "Semantic oracle not configured; set " << kApiKeyVariable
              << " to enable AI analysis" << std::endl;
  }

  // Run Drogon (blocking). Drogon handles SIGINT/SIGTERM itself.
  app.run();

  running_ = false;
  workers_->stop();
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  }
}

}  // namespace simlens::server
