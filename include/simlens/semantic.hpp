#pragma once

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

namespace simlens {

/**
 * Where a semantic result came from.
 *
 * kOracle results were decoded from the provider's reply. kFallback
 * results were synthesized locally and carry the reason in
 * `fallback_reason`; they have exactly the same fields so consumers can
 * render both without branching.
 */
enum class AnalysisSource {
  kOracle,
  kFallback,
};

const char* AnalysisSourceName(AnalysisSource source);

/**
 * Semantic comparison of two texts, as judged by the oracle.
 */
struct SemanticAnalysis {
  AnalysisSource source = AnalysisSource::kFallback;
  std::string fallback_reason;                 // Empty for kOracle
  double semantic_similarity = 0.5;            // [0.0, 1.0]
  std::string insights;
  std::vector<std::string> themes_text1;
  std::vector<std::string> themes_text2;
  std::string key_differences;
  std::string writing_style_comparison;

  bool IsFallback() const { return source == AnalysisSource::kFallback; }
};

/**
 * Free-text writing suggestions from the oracle.
 */
struct ImprovementSuggestions {
  AnalysisSource source = AnalysisSource::kFallback;
  std::string fallback_reason;
  std::string text;

  bool IsFallback() const { return source == AnalysisSource::kFallback; }
};

// Neutral score reported when the oracle's judgment is not available.
constexpr double kFallbackSimilarity = 0.5;

namespace internal {

/**
 * Locate the JSON object embedded in free text: the span from the first
 * '{' to the last '}'. Returns an empty view if there is no such span.
 */
std::string_view ExtractEmbeddedJson(std::string_view text);

/**
 * Parse text that must hold exactly one JSON value. Comments, trailing
 * commas and anything after the value are rejected.
 */
bool ParseJsonDocument(std::string_view text, Json::Value* root, std::string* errors);

/**
 * Decode a provider reply into a SemanticAnalysis.
 *
 * The reply may wrap the JSON object in prose or code fences. Succeeds
 * only if an object is found, it parses, and `semantic_similarity` can be
 * coerced to a number (numeric strings and booleans are accepted). The
 * score is clamped to [0, 1]. Missing text fields default to empty.
 *
 * @param reply Raw reply text
 * @param out Receives the analysis (source kOracle) on success
 * @param error_out Reason on failure
 * @return true if a structured analysis was decoded
 */
bool ParseSemanticAnalysis(std::string_view reply,
                           SemanticAnalysis* out,
                           std::string* error_out);

}  // namespace internal

/**
 * Build the fallback analysis.
 *
 * @param reason Why no structured analysis is available
 * @param raw_reply Provider text that could not be decoded, or empty if
 *                  the provider was never reached
 */
SemanticAnalysis MakeFallbackAnalysis(std::string reason, std::string raw_reply);

// Fallback suggestions carrying the explanatory message.
ImprovementSuggestions MakeFallbackSuggestions(std::string reason);

}  // namespace simlens
