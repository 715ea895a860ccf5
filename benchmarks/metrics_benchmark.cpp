// Performance benchmarks for simlens text comparison
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: normalization and the char n-gram vectorizer
// 2. MACROBENCHMARKS: full Comparator::Compare without the oracle
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed seeds for reproducible inputs

#include <benchmark/benchmark.h>

#include <simlens/comparator.hpp>
#include <simlens/metrics.hpp>
#include <simlens/normalize.hpp>
#include <simlens/vectorizer.hpp>

#include <random>
#include <string>
#include <vector>

namespace {

const std::vector<std::string> kVocabulary = {
    "the", "quick", "brown", "fox", "jumps", "over", "lazy", "dog",
    "similarity", "text", "compare", "metric", "vector", "cosine",
    "jaccard", "overlap", "character", "report", "analysis", "words"};

// Space-separated words from a fixed vocabulary, roughly `bytes` long.
std::string GenerateText(size_t bytes, uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<size_t> pick(0, kVocabulary.size() - 1);
  std::string text;
  while (text.size() < bytes) {
    if (!text.empty()) text += (gen() % 12 == 0) ? ". " : " ";
    text += kVocabulary[pick(gen)];
  }
  return text;
}

}  // namespace

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_Normalize(benchmark::State& state) {
  std::string input = GenerateText(state.range(0), 1);
  for (auto _ : state) {
    auto result = simlens::Normalize(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_Normalize)->Range(64, 1 << 16);

static void BM_Normalize_Unicode(benchmark::State& state) {
  // Mix of ASCII and multi-byte UTF-8
  std::string input;
  while (input.size() < static_cast<size_t>(state.range(0))) {
    input += "caf\xC3\xA9 na\xC3\xAFve \xE6\x97\xA5\xE6\x9C\xAC ";
  }
  for (auto _ : state) {
    auto result = simlens::Normalize(input);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_Normalize_Unicode)->Range(64, 1 << 16);

static void BM_Vectorizer_FitTransform(benchmark::State& state) {
  std::string a = GenerateText(state.range(0), 1);
  std::string b = GenerateText(state.range(0), 2);
  simlens::internal::CharNgramVectorizer vectorizer;
  for (auto _ : state) {
    simlens::internal::TfidfMatrix matrix;
    auto status = vectorizer.FitTransform({a, b}, &matrix);
    benchmark::DoNotOptimize(status);
    benchmark::DoNotOptimize(matrix);
  }
  state.SetBytesProcessed(state.iterations() * (a.size() + b.size()));
}
BENCHMARK(BM_Vectorizer_FitTransform)->Range(64, 1 << 14);

static void BM_CosineSimilarity(benchmark::State& state) {
  std::string a = GenerateText(state.range(0), 3);
  std::string b = GenerateText(state.range(0), 4);
  for (auto _ : state) {
    benchmark::DoNotOptimize(simlens::CosineSimilarity(a, b));
  }
}
BENCHMARK(BM_CosineSimilarity)->Range(64, 1 << 14);

static void BM_SetMetrics(benchmark::State& state) {
  auto a = simlens::Normalize(GenerateText(state.range(0), 5));
  auto b = simlens::Normalize(GenerateText(state.range(0), 6));
  for (auto _ : state) {
    benchmark::DoNotOptimize(simlens::JaccardIndex(a, b));
    benchmark::DoNotOptimize(simlens::WordOverlap(a, b));
    benchmark::DoNotOptimize(simlens::CharacterSimilarity(a, b));
  }
}
BENCHMARK(BM_SetMetrics)->Range(64, 1 << 16);

// =============================================================================
// PART 2: MACROBENCHMARKS
// =============================================================================

static void BM_Compare(benchmark::State& state) {
  std::string a = GenerateText(state.range(0), 7);
  std::string b = GenerateText(state.range(0), 8);
  simlens::Comparator comparator;
  simlens::CompareOptions options;
  for (auto _ : state) {
    simlens::SimilarityReport report;
    std::string error;
    bool ok = comparator.Compare(a, b, options, &report, &error);
    benchmark::DoNotOptimize(ok);
    benchmark::DoNotOptimize(report);
  }
  state.SetBytesProcessed(state.iterations() * (a.size() + b.size()));
}
BENCHMARK(BM_Compare)->Range(64, 1 << 14);

BENCHMARK_MAIN();
