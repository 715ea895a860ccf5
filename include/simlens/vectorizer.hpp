#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace simlens::internal {

enum class VectorizeStatus {
  kOk,
  kEmptyVocabulary,  // No document produced a single n-gram
};

/**
 * Dense TF-IDF matrix over a jointly fitted vocabulary.
 * Columns follow the lexicographic order of `vocabulary`.
 */
struct TfidfMatrix {
  std::vector<std::u32string> vocabulary;
  std::vector<double> idf;
  std::vector<std::vector<double>> rows;  // One L2-normalized row per document
};

/**
 * Character n-gram TF-IDF vectorizer.
 *
 * Documents are lowercased (ASCII) and every run of two or more
 * whitespace characters is collapsed to one space before n-grams of
 * length min_n..max_n are taken over code points. Weights are raw counts
 * times the smoothed idf ln((1 + N) / (1 + df)) + 1, and each row is
 * scaled to unit L2 norm. Rows with no n-grams stay all zero.
 */
class CharNgramVectorizer {
 public:
  explicit CharNgramVectorizer(size_t min_n = 1, size_t max_n = 3)
      : min_n_(min_n), max_n_(max_n) {}

  /**
   * Fit the vocabulary on `docs` and transform them.
   *
   * @param docs Raw UTF-8 documents
   * @param out Receives the matrix when kOk is returned
   */
  VectorizeStatus FitTransform(const std::vector<std::string_view>& docs,
                               TfidfMatrix* out) const;

  // Preprocessed n-grams of one document, in extraction order.
  std::vector<std::u32string> Analyze(std::string_view doc) const;

  // Cosine of two rows of equal length; 0.0 if either row is all zero.
  static double Cosine(const std::vector<double>& a, const std::vector<double>& b);

 private:
  size_t min_n_;
  size_t max_n_;
};

}  // namespace simlens::internal
