#include <simlens/metrics.hpp>
#include <simlens/vectorizer.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <set>
#include <vector>

namespace simlens {

namespace {

// Size of the intersection of two ordered sets.
template <typename T>
size_t IntersectionSize(const std::set<T>& a, const std::set<T>& b) {
  size_t count = 0;
  auto it_a = a.begin();
  auto it_b = b.begin();
  while (it_a != a.end() && it_b != b.end()) {
    if (*it_a < *it_b) {
      ++it_a;
    } else if (*it_b < *it_a) {
      ++it_b;
    } else {
      ++count;
      ++it_a;
      ++it_b;
    }
  }
  return count;
}

}  // namespace

double CharacterSimilarity(const NormalizedText& a, const NormalizedText& b) {
  if (a.letter_set.empty() || b.letter_set.empty()) {
    return 0.0;
  }
  size_t common = IntersectionSize(a.letter_set, b.letter_set);
  size_t total = a.letter_set.size() + b.letter_set.size() - common;
  return static_cast<double>(common) / static_cast<double>(total);
}

double CosineSimilarity(std::string_view text1, std::string_view text2) {
  internal::CharNgramVectorizer vectorizer(1, 3);
  internal::TfidfMatrix matrix;

  auto status = vectorizer.FitTransform({text1, text2}, &matrix);
  if (status != internal::VectorizeStatus::kOk) {
    LOG_DEBUG << "Cosine similarity degenerate (empty n-gram vocabulary), using 0.0";
    return 0.0;
  }

  double cosine = internal::CharNgramVectorizer::Cosine(matrix.rows[0], matrix.rows[1]);
  return std::clamp(cosine, 0.0, 1.0);
}

double JaccardIndex(const NormalizedText& a, const NormalizedText& b) {
  if (a.word_set.empty() && b.word_set.empty()) {
    return 1.0;
  }
  size_t shared = IntersectionSize(a.word_set, b.word_set);
  size_t total = a.word_set.size() + b.word_set.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(total);
}

double WordOverlap(const NormalizedText& a, const NormalizedText& b) {
  if (a.word_set.empty() && b.word_set.empty()) {
    return 100.0;
  }
  size_t shared = IntersectionSize(a.word_set, b.word_set);
  size_t total = a.word_set.size() + b.word_set.size();
  return static_cast<double>(shared) * 2.0 / static_cast<double>(total) * 100.0;
}

uint64_t SizeDifference(std::string_view text1, std::string_view text2) {
  size_t len1 = internal::CodePointLength(text1);
  size_t len2 = internal::CodePointLength(text2);
  return static_cast<uint64_t>(len1 > len2 ? len1 - len2 : len2 - len1);
}

SimilarityScores ComputeScores(std::string_view text1,
                               std::string_view text2,
                               const NormalizedText& norm1,
                               const NormalizedText& norm2) {
  SimilarityScores scores;
  scores.cosine_similarity = CosineSimilarity(text1, text2);
  scores.jaccard_index = JaccardIndex(norm1, norm2);
  scores.word_overlap = WordOverlap(norm1, norm2);
  scores.character_similarity = CharacterSimilarity(norm1, norm2);
  scores.edit_distance = SizeDifference(text1, text2);
  return scores;
}

}  // namespace simlens
