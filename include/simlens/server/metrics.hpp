#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace simlens::server {

/**
 * Prometheus-compatible service metrics.
 *
 * Counts HTTP requests, comparisons and oracle calls, tracks request
 * latency, and exports everything in Prometheus text exposition format.
 * Thread-safe.
 */
class ServiceMetrics {
 public:
  ServiceMetrics() = default;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /**
   * Record an HTTP request metric.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& path,
                         int status_code,
                         double latency_ms);

  // A completed comparison.
  void RecordComparison();

  // A request rejected with 400.
  void RecordInvalidRequest();

  /**
   * Record one oracle call.
   * @param kind "analysis" or "suggestions"
   * @param status "ok" or "fallback"
   */
  void RecordOracleCall(const std::string& kind, const std::string& status);

  uint64_t comparisons() const;
  uint64_t invalid_requests() const;

 private:
  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };

  // (method, path, status) -> count
  using HttpMetricKey = std::tuple<std::string, std::string, int>;

  mutable std::mutex mu_;
  uint64_t comparisons_ = 0;
  uint64_t invalid_requests_ = 0;
  std::map<std::pair<std::string, std::string>, uint64_t> oracle_calls_;
  std::map<HttpMetricKey, uint64_t> http_requests_;
  HistogramData http_latency_;
};

/**
 * Register the metrics endpoint with the Drogon app.
 */
void RegisterMetricsHandler(std::shared_ptr<ServiceMetrics> metrics,
                            const std::string& path);

/**
 * RAII helper for timing HTTP requests.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<ServiceMetrics> metrics,
               std::string method,
               std::string path);

  ~RequestTimer();

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<ServiceMetrics> metrics_;
  std::string method_;
  std::string path_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace simlens::server
