// Tests for the comparison pipeline
// Tests: input validation, lexical report properties, semantic enrichment

#include <gtest/gtest.h>

#include <simlens/comparator.hpp>

#include <json/json.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace simlens {
namespace {

// Transport that answers every request with a fixed candidate text
class CannedTransport : public OracleTransport {
 public:
  explicit CannedTransport(std::string candidate_text) {
    Json::Value part;
    part["text"] = candidate_text;
    Json::Value candidate;
    candidate["content"]["parts"].append(part);
    Json::Value root;
    root["candidates"].append(candidate);
    body_ = Json::writeString(Json::StreamWriterBuilder(), root);
  }

  TransportResponse Post(const std::string&, const std::string&,
                         const Headers&, double) const override {
    call_count_++;
    TransportResponse response;
    response.result = TransportResponse::Result::kOk;
    response.status_code = 200;
    response.body = body_;
    return response;
  }

  int GetCallCount() const { return call_count_; }

 private:
  std::string body_;
  mutable std::atomic<int> call_count_{0};
};

std::shared_ptr<const OracleClient> ConfiguredOracle(std::shared_ptr<const OracleTransport> transport) {
  OracleConfig config;
  config.api_key = "test-key";
  return std::make_shared<OracleClient>(config, std::move(transport));
}

class ComparatorTest : public ::testing::Test {
 protected:
  SimilarityReport MustCompare(const std::string& a, const std::string& b,
                               CompareOptions options = {}) {
    SimilarityReport report;
    std::string error;
    EXPECT_TRUE(comparator_.Compare(a, b, options, &report, &error)) << error;
    return report;
  }

  Comparator comparator_;
};

// =============================================================================
// Input Validation
// =============================================================================

TEST_F(ComparatorTest, RejectsEmptyText) {
  SimilarityReport report;
  std::string error;
  EXPECT_FALSE(comparator_.Compare("", "something", {}, &report, &error));
  EXPECT_EQ(error, kInvalidInputMessage);
  EXPECT_FALSE(comparator_.Compare("something", "", {}, &report, &error));
}

TEST_F(ComparatorTest, RejectsWhitespaceOnlyText) {
  SimilarityReport report;
  std::string error;
  EXPECT_FALSE(comparator_.Compare("  \t\n", "text", {}, &report, &error));
  EXPECT_EQ(error, "Please enter both texts");
  EXPECT_FALSE(comparator_.Compare("text", "\xC2\xA0\xE3\x80\x80", {}, &report, &error));
}

TEST_F(ComparatorTest, RejectedInputNeverReachesOracle) {
  auto transport = std::make_shared<CannedTransport>(R"({"semantic_similarity": 1})");
  Comparator comparator(ConfiguredOracle(transport));

  SimilarityReport report;
  std::string error;
  CompareOptions options;
  options.semantic = true;
  EXPECT_FALSE(comparator.Compare(" ", "text", options, &report, &error));
  EXPECT_EQ(transport->GetCallCount(), 0);
}

TEST_F(ComparatorTest, PunctuationOnlyIsValidInput) {
  SimilarityReport report = MustCompare("!!!", "???");
  EXPECT_DOUBLE_EQ(report.scores.jaccard_index, 1.0);
  EXPECT_DOUBLE_EQ(report.scores.word_overlap, 100.0);
  EXPECT_DOUBLE_EQ(report.scores.character_similarity, 0.0);
  EXPECT_EQ(report.stats.text1_words, 0u);
}

// =============================================================================
// Lexical Report
// =============================================================================

TEST_F(ComparatorTest, IdenticalTextsExample) {
  SimilarityReport report = MustCompare("the cat sat", "the cat sat");
  EXPECT_DOUBLE_EQ(report.scores.jaccard_index, 1.0);
  EXPECT_DOUBLE_EQ(report.scores.word_overlap, 100.0);
  EXPECT_NEAR(report.scores.cosine_similarity, 1.0, 1e-9);
  EXPECT_EQ(report.diff.shared, (std::vector<std::string>{"cat", "sat", "the"}));
  EXPECT_TRUE(report.diff.unique_to_first.empty());
  EXPECT_TRUE(report.diff.unique_to_second.empty());
  EXPECT_FALSE(report.semantic.has_value());
  EXPECT_FALSE(report.suggestions.has_value());
}

TEST_F(ComparatorTest, TrimsBeforeMeasuring) {
  SimilarityReport report = MustCompare("   hello world  \n", "hello world");
  EXPECT_EQ(report.scores.edit_distance, 0u);
  EXPECT_EQ(report.stats.text1_chars, 11u);
  EXPECT_NEAR(report.scores.cosine_similarity, 1.0, 1e-9);
}

TEST_F(ComparatorTest, EditDistanceIsLengthDifference) {
  // Same length, entirely different content
  SimilarityReport report = MustCompare("abcd", "wxyz");
  EXPECT_EQ(report.scores.edit_distance, 0u);
  report = MustCompare("short", "much longer text");
  EXPECT_EQ(report.scores.edit_distance, 11u);
}

TEST_F(ComparatorTest, SwappingInputsSwapsDiff) {
  SimilarityReport ab = MustCompare("red green blue", "green yellow");
  SimilarityReport ba = MustCompare("green yellow", "red green blue");

  EXPECT_EQ(ab.scores.cosine_similarity, ba.scores.cosine_similarity);
  EXPECT_EQ(ab.scores.jaccard_index, ba.scores.jaccard_index);
  EXPECT_EQ(ab.diff.shared, ba.diff.shared);
  EXPECT_EQ(ab.diff.unique_to_first, ba.diff.unique_to_second);
  EXPECT_EQ(ab.diff.unique_to_second, ba.diff.unique_to_first);
  EXPECT_EQ(ab.stats.total_unique_words, ba.stats.total_unique_words);
}

TEST_F(ComparatorTest, DiffPartitionsWordUnion) {
  SimilarityReport report = MustCompare("one two three four", "three four five");
  size_t total = report.diff.shared.size() + report.diff.unique_to_first.size() +
                 report.diff.unique_to_second.size();
  EXPECT_EQ(total, report.stats.total_unique_words);
}

// =============================================================================
// Semantic Enrichment
// =============================================================================

TEST_F(ComparatorTest, SemanticWithoutKeyFallsBack) {
  CompareOptions options;
  options.semantic = true;
  SimilarityReport report = MustCompare("cats purr", "dogs bark", options);

  ASSERT_TRUE(report.semantic.has_value());
  ASSERT_TRUE(report.suggestions.has_value());
  EXPECT_TRUE(report.semantic->IsFallback());
  EXPECT_EQ(report.semantic->fallback_reason, "not configured");
  EXPECT_DOUBLE_EQ(report.semantic->semantic_similarity, 0.5);
  EXPECT_TRUE(report.suggestions->IsFallback());
  EXPECT_FALSE(comparator_.oracle().IsConfigured());
}

TEST_F(ComparatorTest, SemanticUsesOracle) {
  auto transport = std::make_shared<CannedTransport>(
      R"({"semantic_similarity": 0.35, "insights": "Different animals."})");
  Comparator comparator(ConfiguredOracle(transport));

  CompareOptions options;
  options.semantic = true;
  SimilarityReport report;
  std::string error;
  ASSERT_TRUE(comparator.Compare("cats purr", "dogs bark", options, &report, &error));

  ASSERT_TRUE(report.semantic.has_value());
  EXPECT_EQ(report.semantic->source, AnalysisSource::kOracle);
  EXPECT_DOUBLE_EQ(report.semantic->semantic_similarity, 0.35);
  // Analysis plus suggestions
  EXPECT_EQ(transport->GetCallCount(), 2);
  EXPECT_EQ(report.suggestions->source, AnalysisSource::kOracle);
}

TEST_F(ComparatorTest, LexicalScoresIndependentOfOracle) {
  auto transport = std::make_shared<CannedTransport>("not json");
  Comparator enriched(ConfiguredOracle(transport));

  CompareOptions options;
  options.semantic = true;
  SimilarityReport with_oracle;
  std::string error;
  ASSERT_TRUE(enriched.Compare("alpha beta", "beta gamma", options, &with_oracle, &error));
  SimilarityReport plain = MustCompare("alpha beta", "beta gamma");

  EXPECT_EQ(with_oracle.scores.cosine_similarity, plain.scores.cosine_similarity);
  EXPECT_EQ(with_oracle.scores.jaccard_index, plain.scores.jaccard_index);
  EXPECT_EQ(with_oracle.diff.shared, plain.diff.shared);
  EXPECT_TRUE(with_oracle.semantic->IsFallback());
  EXPECT_EQ(with_oracle.semantic->insights, "not json");
}

TEST_F(ComparatorTest, ConcurrentComparisons) {
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 20; ++i) {
        SimilarityReport report;
        std::string error;
        std::string text = "thread " + std::to_string(t) + " iteration " + std::to_string(i);
        if (comparator_.Compare(text, text, {}, &report, &error) &&
            report.scores.jaccard_index == 1.0) {
          successes++;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(successes.load(), 160);
}

}  // namespace
}  // namespace simlens
