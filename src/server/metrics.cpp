#include <simlens/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace simlens::server {

namespace {

// Histogram buckets for latency (in milliseconds). Oracle-backed requests
// can take up to the oracle timeout, hence the long tail.
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 30000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

}  // namespace

// --- ServiceMetrics ---

void ServiceMetrics::RecordHttpRequest(const std::string& method,
                                       const std::string& path,
                                       int status_code,
                                       double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  http_requests_[HttpMetricKey{method, path, status_code}]++;

  if (http_latency_.buckets.empty()) {
    http_latency_.buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(latency_ms, kLatencyBuckets);
  for (size_t i = bucket; i < http_latency_.buckets.size(); ++i) {
    http_latency_.buckets[i]++;
  }
  http_latency_.count++;
  http_latency_.sum += latency_ms;
}

void ServiceMetrics::RecordComparison() {
  std::lock_guard<std::mutex> lock(mu_);
  comparisons_++;
}

void ServiceMetrics::RecordInvalidRequest() {
  std::lock_guard<std::mutex> lock(mu_);
  invalid_requests_++;
}

void ServiceMetrics::RecordOracleCall(const std::string& kind,
                                      const std::string& status) {
  std::lock_guard<std::mutex> lock(mu_);
  oracle_calls_[{kind, status}]++;
}

uint64_t ServiceMetrics::comparisons() const {
  std::lock_guard<std::mutex> lock(mu_);
  return comparisons_;
}

uint64_t ServiceMetrics::invalid_requests() const {
  std::lock_guard<std::mutex> lock(mu_);
  return invalid_requests_;
}

std::string ServiceMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  out << "# TYPE simlens_comparisons_total counter\n";
  out << "simlens_comparisons_total " << comparisons_ << "\n";
  out << "# TYPE simlens_invalid_requests_total counter\n";
  out << "simlens_invalid_requests_total " << invalid_requests_ << "\n";

  if (!oracle_calls_.empty()) {
    out << "# TYPE simlens_oracle_calls_total counter\n";
    for (const auto& [key, count] : oracle_calls_) {
      out << "simlens_oracle_calls_total{kind=\"" << key.first
          << "\",status=\"" << key.second << "\"} " << count << "\n";
    }
  }

  if (!http_requests_.empty()) {
    out << "# TYPE simlens_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      const auto& [method, path, status_code] = key;
      out << "simlens_http_requests_total{method=\"" << method
          << "\",path=\"" << path << "\",status=\"" << status_code
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    out << "# TYPE simlens_http_request_duration_ms histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << "simlens_http_request_duration_ms_bucket{le=\""
          << kLatencyBuckets[i] << "\"} " << http_latency_.buckets[i] << "\n";
    }
    out << "simlens_http_request_duration_ms_bucket{le=\"+Inf\"} "
        << http_latency_.buckets.back() << "\n";
    out << "simlens_http_request_duration_ms_sum " << http_latency_.sum << "\n";
    out << "simlens_http_request_duration_ms_count " << http_latency_.count << "\n";
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<ServiceMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<ServiceMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto end = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
    double latency_ms = static_cast<double>(duration.count()) / 1000.0;
    metrics_->RecordHttpRequest(method_, path_, status_code_, latency_ms);
  }
}

}  // namespace simlens::server
