#include <simlens/comparator.hpp>

#include <iostream>

int main() {
  // No API key: the oracle stays unconfigured and is only consulted
  // when a comparison asks for semantic analysis.
  simlens::Comparator comparator;

  simlens::SimilarityReport report;
  std::string error;
  if (!comparator.Compare("The quick brown fox jumps over the lazy dog.",
                          "A quick brown dog leaps over the lazy fox!",
                          {}, &report, &error)) {
    std::cerr << "Compare failed: " << error << "\n";
    return 1;
  }

  const auto& s = report.scores;
  std::cout << "cosine=" << s.cosine_similarity
            << " jaccard=" << s.jaccard_index
            << " overlap=" << s.word_overlap << "%"
            << " character=" << s.character_similarity
            << " length_diff=" << s.edit_distance << "\n";

  std::cout << "shared:";
  for (const auto& word : report.diff.shared) std::cout << " " << word;
  std::cout << "\n";

  // Blank input is rejected before anything is computed.
  if (!comparator.Compare("   ", "text", {}, &report, &error)) {
    std::cout << "blank input: " << error << "\n";
  }

  // Semantic analysis without a key degrades to the fallback.
  simlens::CompareOptions semantic;
  semantic.semantic = true;
  if (comparator.Compare("cats purr", "dogs bark", semantic, &report, &error)) {
    std::cout << "semantic source=" << simlens::AnalysisSourceName(report.semantic->source)
              << " reason=" << report.semantic->fallback_reason << "\n";
  }

  std::cout << "done\n";
  return 0;
}
