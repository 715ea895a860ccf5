#pragma once

#include <simlens/comparator.hpp>
#include <simlens/server/config.hpp>

#include <trantor/utils/ConcurrentTaskQueue.h>

#include <memory>
#include <string>

namespace simlens::server {

/**
 * Simlens HTTP Server.
 *
 * Serves text comparisons over a REST API using Drogon:
 *   POST /compare, GET /health and, when enabled, GET /metrics.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down (SIGINT/SIGTERM or Shutdown()).
   */
  void Run();

  /**
   * Request shutdown (async).
   */
  void Shutdown();

  const Comparator& comparator() const { return *comparator_; }

 private:
  void SetupRoutes();

  Config config_;
  std::shared_ptr<const Comparator> comparator_;
  std::shared_ptr<trantor::ConcurrentTaskQueue> workers_;
  bool running_ = false;
};

}  // namespace simlens::server
