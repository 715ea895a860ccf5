#pragma once

#include <simlens/oracle_client.hpp>
#include <simlens/report.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace simlens {

struct CompareOptions {
  // Ask the oracle for a semantic analysis and suggestions.
  bool semantic = false;
};

/**
 * Runs the comparison pipeline for one text pair:
 * trim and validate, normalize, score, diff, and optionally enrich with
 * the oracle.
 *
 * Holds no per-request state; one instance serves concurrent callers.
 *
 * Example:
 *   simlens::Comparator comparator;
 *   simlens::SimilarityReport report;
 *   std::string error;
 *   if (!comparator.Compare("the cat sat", "the cat sat", {}, &report, &error)) {
 *     // error == "Please enter both texts" for blank input
 *   }
 */
class Comparator {
 public:
  /**
   * @param oracle Semantic oracle; when null, an unconfigured client is
   *               used and semantic requests get the fallback analysis
   */
  explicit Comparator(std::shared_ptr<const OracleClient> oracle = nullptr);

  /**
   * Compare two texts.
   *
   * Both texts are trimmed of surrounding whitespace first; the trimmed
   * texts are what every metric and stat describes.
   *
   * @param text1, text2 Raw input texts
   * @param options Per-request switches
   * @param report Receives the report on success
   * @param error_out Set when the input is rejected
   * @return false if either text is empty after trimming; nothing is
   *         computed in that case
   */
  bool Compare(std::string_view text1,
               std::string_view text2,
               const CompareOptions& options,
               SimilarityReport* report,
               std::string* error_out) const;

  const OracleClient& oracle() const { return *oracle_; }

 private:
  std::shared_ptr<const OracleClient> oracle_;
};

// Message returned for blank input.
constexpr const char* kInvalidInputMessage = "Please enter both texts";

}  // namespace simlens
