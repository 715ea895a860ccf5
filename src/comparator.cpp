#include <simlens/comparator.hpp>
#include <simlens/normalize.hpp>

#include <trantor/utils/Logger.h>

namespace simlens {

Comparator::Comparator(std::shared_ptr<const OracleClient> oracle)
    : oracle_(std::move(oracle)) {
  if (!oracle_) {
    oracle_ = std::make_shared<OracleClient>(OracleConfig{});
  }
}

bool Comparator::Compare(std::string_view text1,
                         std::string_view text2,
                         const CompareOptions& options,
                         SimilarityReport* report,
                         std::string* error_out) const {
  std::string_view trimmed1 = internal::TrimWhitespace(text1);
  std::string_view trimmed2 = internal::TrimWhitespace(text2);

  if (trimmed1.empty() || trimmed2.empty()) {
    if (error_out) *error_out = kInvalidInputMessage;
    return false;
  }

  NormalizedText norm1 = Normalize(trimmed1);
  NormalizedText norm2 = Normalize(trimmed2);

  SimilarityScores scores = ComputeScores(trimmed1, trimmed2, norm1, norm2);
  WordDiff diff = ComputeWordDiff(norm1, norm2);
  TextStats stats = ComputeStats(trimmed1, trimmed2, norm1, norm2);

  std::optional<SemanticAnalysis> semantic;
  std::optional<ImprovementSuggestions> suggestions;
  if (options.semantic) {
    semantic = oracle_->Analyze(trimmed1, trimmed2);
    suggestions = oracle_->Suggest(trimmed1, trimmed2, scores);
    if (semantic->IsFallback()) {
      LOG_DEBUG << "Semantic analysis fell back: " << semantic->fallback_reason;
    }
  }

  *report = BuildReport(scores, std::move(diff), stats,
                        std::move(semantic), std::move(suggestions));
  return true;
}

}  // namespace simlens
