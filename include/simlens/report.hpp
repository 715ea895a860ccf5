#pragma once

#include <simlens/metrics.hpp>
#include <simlens/normalize.hpp>
#include <simlens/semantic.hpp>

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simlens {

/**
 * Set difference of two word sets, each side sorted.
 */
struct WordDiff {
  std::vector<std::string> shared;
  std::vector<std::string> unique_to_first;
  std::vector<std::string> unique_to_second;
};

struct TextStats {
  uint64_t text1_words = 0;  // Word-sequence length, duplicates counted
  uint64_t text2_words = 0;
  uint64_t text1_chars = 0;  // Code points
  uint64_t text2_chars = 0;
  uint64_t total_unique_words = 0;
};

/**
 * Result of one comparison. Built once by BuildReport and not modified
 * afterwards.
 */
struct SimilarityReport {
  SimilarityScores scores;
  WordDiff diff;
  TextStats stats;
  std::optional<SemanticAnalysis> semantic;
  std::optional<ImprovementSuggestions> suggestions;
};

WordDiff ComputeWordDiff(const NormalizedText& a, const NormalizedText& b);

TextStats ComputeStats(std::string_view text1,
                       std::string_view text2,
                       const NormalizedText& norm1,
                       const NormalizedText& norm2);

/**
 * Assemble the report from its parts.
 */
SimilarityReport BuildReport(const SimilarityScores& scores,
                             WordDiff diff,
                             const TextStats& stats,
                             std::optional<SemanticAnalysis> semantic,
                             std::optional<ImprovementSuggestions> suggestions);

/**
 * Wire form of a report.
 *
 * Top-level keys: cosine_similarity, jaccard_index, word_overlap,
 * character_similarity, edit_distance, shared_words, unique_text1,
 * unique_text2, stats, and when present gemini_analysis and
 * improvement_suggestions.
 */
Json::Value ToJson(const SimilarityReport& report);

Json::Value ToJson(const SemanticAnalysis& analysis);

}  // namespace simlens
