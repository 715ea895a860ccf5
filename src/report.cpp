#include <simlens/report.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace simlens {

namespace {

Json::Value ToJsonArray(const std::vector<std::string>& items) {
  Json::Value array(Json::arrayValue);
  for (const auto& item : items) {
    array.append(item);
  }
  return array;
}

}  // namespace

WordDiff ComputeWordDiff(const NormalizedText& a, const NormalizedText& b) {
  // std::set iterates in sorted order, so the outputs are sorted too.
  WordDiff diff;
  std::set_intersection(a.word_set.begin(), a.word_set.end(),
                        b.word_set.begin(), b.word_set.end(),
                        std::back_inserter(diff.shared));
  std::set_difference(a.word_set.begin(), a.word_set.end(),
                      b.word_set.begin(), b.word_set.end(),
                      std::back_inserter(diff.unique_to_first));
  std::set_difference(b.word_set.begin(), b.word_set.end(),
                      a.word_set.begin(), a.word_set.end(),
                      std::back_inserter(diff.unique_to_second));
  return diff;
}

TextStats ComputeStats(std::string_view text1,
                       std::string_view text2,
                       const NormalizedText& norm1,
                       const NormalizedText& norm2) {
  TextStats stats;
  stats.text1_words = norm1.words.size();
  stats.text2_words = norm2.words.size();
  stats.text1_chars = internal::CodePointLength(text1);
  stats.text2_chars = internal::CodePointLength(text2);

  size_t shared = 0;
  for (const auto& word : norm1.word_set) {
    shared += norm2.word_set.count(word);
  }
  stats.total_unique_words = norm1.word_set.size() + norm2.word_set.size() - shared;
  return stats;
}

SimilarityReport BuildReport(const SimilarityScores& scores,
                             WordDiff diff,
                             const TextStats& stats,
                             std::optional<SemanticAnalysis> semantic,
                             std::optional<ImprovementSuggestions> suggestions) {
  SimilarityReport report;
  report.scores = scores;
  report.diff = std::move(diff);
  report.stats = stats;
  report.semantic = std::move(semantic);
  report.suggestions = std::move(suggestions);
  return report;
}

Json::Value ToJson(const SemanticAnalysis& analysis) {
  Json::Value json;
  json["semantic_similarity"] = analysis.semantic_similarity;
  json["insights"] = analysis.insights;
  json["themes_text1"] = ToJsonArray(analysis.themes_text1);
  json["themes_text2"] = ToJsonArray(analysis.themes_text2);
  json["key_differences"] = analysis.key_differences;
  json["writing_style_comparison"] = analysis.writing_style_comparison;
  json["source"] = AnalysisSourceName(analysis.source);
  if (analysis.IsFallback()) {
    json["fallback_reason"] = analysis.fallback_reason;
  }
  return json;
}

Json::Value ToJson(const SimilarityReport& report) {
  Json::Value json;
  json["cosine_similarity"] = report.scores.cosine_similarity;
  json["jaccard_index"] = report.scores.jaccard_index;
  json["word_overlap"] = report.scores.word_overlap;
  json["character_similarity"] = report.scores.character_similarity;
  json["edit_distance"] = static_cast<Json::UInt64>(report.scores.edit_distance);

  json["shared_words"] = ToJsonArray(report.diff.shared);
  json["unique_text1"] = ToJsonArray(report.diff.unique_to_first);
  json["unique_text2"] = ToJsonArray(report.diff.unique_to_second);

  Json::Value stats;
  stats["text1_words"] = static_cast<Json::UInt64>(report.stats.text1_words);
  stats["text2_words"] = static_cast<Json::UInt64>(report.stats.text2_words);
  stats["text1_chars"] = static_cast<Json::UInt64>(report.stats.text1_chars);
  stats["text2_chars"] = static_cast<Json::UInt64>(report.stats.text2_chars);
  stats["total_unique_words"] = static_cast<Json::UInt64>(report.stats.total_unique_words);
  json["stats"] = stats;

  if (report.semantic) {
    json["gemini_analysis"] = ToJson(*report.semantic);
  }
  if (report.suggestions) {
    json["improvement_suggestions"] = report.suggestions->text;
  }
  return json;
}

}  // namespace simlens
