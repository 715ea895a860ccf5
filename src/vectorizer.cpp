#include <simlens/vectorizer.hpp>
#include <simlens/normalize.hpp>

#include <cmath>
#include <map>
#include <unordered_map>

namespace simlens::internal {

std::vector<std::u32string> CharNgramVectorizer::Analyze(std::string_view doc) const {
  std::u32string decoded = DecodeUtf8(doc);

  // Lowercase and collapse whitespace runs of length >= 2; a lone
  // whitespace character is kept as it is.
  std::u32string text;
  text.reserve(decoded.size());
  size_t i = 0;
  while (i < decoded.size()) {
    if (IsUnicodeSpace(decoded[i])) {
      size_t run_end = i;
      while (run_end < decoded.size() && IsUnicodeSpace(decoded[run_end])) {
        ++run_end;
      }
      text += (run_end - i >= 2) ? U' ' : decoded[i];
      i = run_end;
      continue;
    }
    text += UnicodeLower(decoded[i]);
    ++i;
  }

  std::vector<std::u32string> ngrams;
  for (size_t n = min_n_; n <= max_n_; ++n) {
    if (n == 0 || text.size() < n) continue;
    for (size_t pos = 0; pos + n <= text.size(); ++pos) {
      ngrams.push_back(text.substr(pos, n));
    }
  }
  return ngrams;
}

VectorizeStatus CharNgramVectorizer::FitTransform(
    const std::vector<std::string_view>& docs, TfidfMatrix* out) const {
  std::vector<std::unordered_map<std::u32string, size_t>> counts(docs.size());
  std::map<std::u32string, size_t> columns;

  for (size_t d = 0; d < docs.size(); ++d) {
    for (auto& gram : Analyze(docs[d])) {
      columns.emplace(gram, 0);
      counts[d][std::move(gram)]++;
    }
  }

  if (columns.empty()) {
    return VectorizeStatus::kEmptyVocabulary;
  }

  TfidfMatrix matrix;
  matrix.vocabulary.reserve(columns.size());
  size_t next = 0;
  for (auto& [gram, column] : columns) {
    column = next++;
    matrix.vocabulary.push_back(gram);
  }

  // Document frequency and smoothed idf
  std::vector<size_t> df(columns.size(), 0);
  for (const auto& doc_counts : counts) {
    for (const auto& [gram, count] : doc_counts) {
      (void)count;
      df[columns.at(gram)]++;
    }
  }
  const double n_docs = static_cast<double>(docs.size());
  matrix.idf.resize(columns.size());
  for (size_t c = 0; c < df.size(); ++c) {
    matrix.idf[c] = std::log((1.0 + n_docs) / (1.0 + static_cast<double>(df[c]))) + 1.0;
  }

  matrix.rows.assign(docs.size(), std::vector<double>(columns.size(), 0.0));
  for (size_t d = 0; d < docs.size(); ++d) {
    auto& row = matrix.rows[d];
    for (const auto& [gram, count] : counts[d]) {
      size_t c = columns.at(gram);
      row[c] = static_cast<double>(count) * matrix.idf[c];
    }

    double norm = 0.0;
    for (double v : row) norm += v * v;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
      for (double& v : row) v /= norm;
    }
  }

  *out = std::move(matrix);
  return VectorizeStatus::kOk;
}

double CharNgramVectorizer::Cosine(const std::vector<double>& a,
                                   const std::vector<double>& b) {
  if (a.size() != b.size()) return 0.0;

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace simlens::internal
