#pragma once

#include <simlens/metrics.hpp>
#include <simlens/semantic.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace simlens {

/**
 * Connection settings for the semantic oracle (Gemini generateContent).
 * An empty api_key means the oracle is not configured.
 */
struct OracleConfig {
  std::string api_key;
  std::string base_url = "https://generativelanguage.googleapis.com";
  std::string model = "gemini-1.5-flash";
  uint32_t timeout_ms = 30000;
  size_t analysis_prefix_chars = 500;    // Per-text prefix sent for analysis
  size_t suggestion_prefix_chars = 200;  // Per-text prefix sent for suggestions

  bool IsConfigured() const { return !api_key.empty(); }
};

/**
 * Outcome of one oracle request. Every failure mode is distinct so that
 * callers and tests can tell them apart; none of them is an exception.
 */
enum class OracleStatus {
  kOk,
  kNotConfigured,     // No API key; no request was made
  kTransportFailure,  // Connection, DNS or TLS failure
  kTimeout,           // No reply within timeout_ms
  kHttpError,         // Reply with a non-200 status
  kEmptyReply,        // 200, but the envelope carried no candidate text
};

const char* OracleStatusName(OracleStatus status);

struct OracleReply {
  OracleStatus status = OracleStatus::kNotConfigured;
  int http_status = 0;
  std::string text;           // Candidate text when status is kOk
  std::string error_message;  // Detail for the failure modes

  bool ok() const { return status == OracleStatus::kOk; }
};

/**
 * Result of a raw HTTP exchange with the provider.
 */
struct TransportResponse {
  enum class Result {
    kOk,        // A response arrived (any status code)
    kTimeout,
    kFailure,
  };

  Result result = Result::kFailure;
  int status_code = 0;
  std::string body;
  std::string error_message;
};

/**
 * Outbound HTTP seam of the oracle client.
 *
 * The production implementation runs Drogon HTTP clients on a private
 * event loop; tests substitute a fake that returns canned responses.
 * Implementations must be safe to call from several threads at once.
 */
class OracleTransport {
 public:
  using Headers = std::vector<std::pair<std::string, std::string>>;

  virtual ~OracleTransport() = default;

  /**
   * POST a JSON body and block until a response or the timeout.
   *
   * @param path Request path (including any query string)
   * @param body JSON request body
   * @param headers Extra request headers
   * @param timeout_seconds Upper bound on the whole exchange
   */
  virtual TransportResponse Post(const std::string& path,
                                 const std::string& body,
                                 const Headers& headers,
                                 double timeout_seconds) const = 0;
};

/**
 * Create the Drogon-backed transport for `base_url`
 * (scheme://host[:port]).
 */
std::unique_ptr<OracleTransport> CreateHttpTransport(const std::string& base_url);

/**
 * Client for the external semantic-analysis provider.
 *
 * Never throws and never reports failure to its caller: Analyze() and
 * Suggest() always return a value, tagged kFallback when the provider
 * could not be used. Immutable after construction and safe to share
 * between threads.
 */
class OracleClient {
 public:
  /**
   * @param config Provider settings
   * @param transport HTTP seam; when null and the config has an API key,
   *                  the Drogon transport for config.base_url is created
   */
  explicit OracleClient(OracleConfig config,
                        std::shared_ptr<const OracleTransport> transport = nullptr);

  bool IsConfigured() const { return config_.IsConfigured(); }
  const OracleConfig& config() const { return config_; }

  /**
   * Send one prompt and extract the candidate text from the reply.
   */
  OracleReply Generate(const std::string& prompt) const;

  /**
   * Semantic comparison of two texts. Each text is cut to
   * config().analysis_prefix_chars code points before sending.
   */
  SemanticAnalysis Analyze(std::string_view text1, std::string_view text2) const;

  /**
   * Writing suggestions given the lexical scores already computed.
   * Each text is cut to config().suggestion_prefix_chars code points.
   */
  ImprovementSuggestions Suggest(std::string_view text1,
                                 std::string_view text2,
                                 const SimilarityScores& scores) const;

 private:
  std::string RequestPath() const;

  OracleConfig config_;
  std::shared_ptr<const OracleTransport> transport_;
};

namespace internal {

std::string FormatAnalysisPrompt(std::string_view text1, std::string_view text2);

std::string FormatSuggestionPrompt(std::string_view text1,
                                   std::string_view text2,
                                   const SimilarityScores& scores);

// {"contents":[{"parts":[{"text": prompt}]}]}
std::string BuildGenerateContentBody(const std::string& prompt);

/**
 * Pull candidates[0].content.parts[0].text out of a generateContent
 * response body. Returns false if the body has no such string.
 */
bool ExtractCandidateText(std::string_view body, std::string* text_out);

}  // namespace internal
}  // namespace simlens
