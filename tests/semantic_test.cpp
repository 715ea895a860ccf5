// Unit tests for simlens/semantic.hpp
// Tests: decoding oracle replies and the fallback values

#include <gtest/gtest.h>

#include <simlens/semantic.hpp>

#include <string>
#include <vector>

namespace simlens {
namespace {

using internal::ExtractEmbeddedJson;
using internal::ParseSemanticAnalysis;

// =============================================================================
// Embedded JSON
// =============================================================================

TEST(ExtractEmbeddedJsonTest, SpansFirstToLastBrace) {
  EXPECT_EQ(ExtractEmbeddedJson("Sure! {\"a\": {\"b\": 1}} Hope this helps."),
            "{\"a\": {\"b\": 1}}");
}

TEST(ExtractEmbeddedJsonTest, StripsCodeFences) {
  EXPECT_EQ(ExtractEmbeddedJson("```json\n{\"x\": 1}\n```"), "{\"x\": 1}");
}

TEST(ExtractEmbeddedJsonTest, NoObject) {
  EXPECT_TRUE(ExtractEmbeddedJson("no braces here").empty());
  EXPECT_TRUE(ExtractEmbeddedJson("} backwards {").empty());
}

// =============================================================================
// ParseSemanticAnalysis
// =============================================================================

class ParseSemanticAnalysisTest : public ::testing::Test {
 protected:
  bool Parse(const std::string& reply) {
    error_.clear();
    return ParseSemanticAnalysis(reply, &analysis_, &error_);
  }

  SemanticAnalysis analysis_;
  std::string error_;
};

TEST_F(ParseSemanticAnalysisTest, FullReply) {
  ASSERT_TRUE(Parse(R"(Here is the analysis:
```json
{
  "semantic_similarity": 0.72,
  "insights": "Both texts describe animals.",
  "themes_text1": ["cats", "sleep"],
  "themes_text2": ["dogs"],
  "key_differences": "Different species.",
  "writing_style_comparison": "Both informal."
}
```)")) << error_;

  EXPECT_EQ(analysis_.source, AnalysisSource::kOracle);
  EXPECT_FALSE(analysis_.IsFallback());
  EXPECT_TRUE(analysis_.fallback_reason.empty());
  EXPECT_DOUBLE_EQ(analysis_.semantic_similarity, 0.72);
  EXPECT_EQ(analysis_.insights, "Both texts describe animals.");
  EXPECT_EQ(analysis_.themes_text1, (std::vector<std::string>{"cats", "sleep"}));
  EXPECT_EQ(analysis_.themes_text2, (std::vector<std::string>{"dogs"}));
  EXPECT_EQ(analysis_.key_differences, "Different species.");
  EXPECT_EQ(analysis_.writing_style_comparison, "Both informal.");
}

TEST_F(ParseSemanticAnalysisTest, MissingTextFieldsDefaultToEmpty) {
  ASSERT_TRUE(Parse(R"({"semantic_similarity": 1})"));
  EXPECT_DOUBLE_EQ(analysis_.semantic_similarity, 1.0);
  EXPECT_TRUE(analysis_.insights.empty());
  EXPECT_TRUE(analysis_.themes_text1.empty());
}

TEST_F(ParseSemanticAnalysisTest, ScoreIsClamped) {
  ASSERT_TRUE(Parse(R"({"semantic_similarity": 1.7})"));
  EXPECT_DOUBLE_EQ(analysis_.semantic_similarity, 1.0);
  ASSERT_TRUE(Parse(R"({"semantic_similarity": -0.2})"));
  EXPECT_DOUBLE_EQ(analysis_.semantic_similarity, 0.0);
}

TEST_F(ParseSemanticAnalysisTest, NumericStringScore) {
  ASSERT_TRUE(Parse(R"({"semantic_similarity": " 0.25 "})"));
  EXPECT_DOUBLE_EQ(analysis_.semantic_similarity, 0.25);
}

TEST_F(ParseSemanticAnalysisTest, NonStringFieldsRenderedAsJson) {
  ASSERT_TRUE(Parse(R"({"semantic_similarity": 0.5, "insights": {"note": "x"},
                        "themes_text1": "single theme"})"));
  EXPECT_EQ(analysis_.insights, R"({"note":"x"})");
  EXPECT_EQ(analysis_.themes_text1, (std::vector<std::string>{"single theme"}));
}

TEST_F(ParseSemanticAnalysisTest, NoJsonObject) {
  EXPECT_FALSE(Parse("The texts are quite similar."));
  EXPECT_EQ(error_, "no JSON object in reply");
}

TEST_F(ParseSemanticAnalysisTest, InvalidJson) {
  EXPECT_FALSE(Parse("{semantic_similarity: high}"));
  EXPECT_EQ(error_.rfind("invalid JSON in reply", 0), 0u) << error_;
}

TEST_F(ParseSemanticAnalysisTest, TrailingProseWithBraces) {
  EXPECT_FALSE(Parse(R"(Here: {"semantic_similarity": 0.8, "insights": "close"} Note {see above})"));
  EXPECT_EQ(error_.rfind("invalid JSON in reply", 0), 0u) << error_;
}

TEST_F(ParseSemanticAnalysisTest, TwoObjects) {
  EXPECT_FALSE(Parse(R"({"semantic_similarity": 0.8} {"semantic_similarity": 0.1})"));
}

TEST_F(ParseSemanticAnalysisTest, CommentInsideJson) {
  EXPECT_FALSE(Parse("{\"semantic_similarity\": 0.8 // comment\n}"));
  EXPECT_FALSE(Parse("{\"semantic_similarity\": /* high */ 0.8}"));
}

TEST_F(ParseSemanticAnalysisTest, TrailingComma) {
  EXPECT_FALSE(Parse(R"({"semantic_similarity": 0.8,})"));
}

TEST_F(ParseSemanticAnalysisTest, MissingScore) {
  EXPECT_FALSE(Parse(R"({"insights": "no score"})"));
  EXPECT_EQ(error_, "reply JSON has no semantic_similarity");
}

TEST_F(ParseSemanticAnalysisTest, NonNumericScore) {
  EXPECT_FALSE(Parse(R"({"semantic_similarity": "high"})"));
  EXPECT_EQ(error_, "semantic_similarity is not a number");
  EXPECT_FALSE(Parse(R"({"semantic_similarity": [0.5]})"));
  EXPECT_FALSE(Parse(R"({"semantic_similarity": null})"));
}

// =============================================================================
// Fallbacks
// =============================================================================

TEST(FallbackTest, WithoutReply) {
  SemanticAnalysis analysis = MakeFallbackAnalysis("timeout", "");
  EXPECT_TRUE(analysis.IsFallback());
  EXPECT_EQ(analysis.fallback_reason, "timeout");
  EXPECT_DOUBLE_EQ(analysis.semantic_similarity, kFallbackSimilarity);
  EXPECT_EQ(analysis.insights,
            "Unable to generate AI analysis. Please check your API key and internet connection.");
  EXPECT_EQ(analysis.themes_text1, (std::vector<std::string>{"Analysis unavailable"}));
  EXPECT_EQ(analysis.themes_text2, (std::vector<std::string>{"Analysis unavailable"}));
  EXPECT_EQ(analysis.key_differences, "Analysis could not be completed");
  EXPECT_EQ(analysis.writing_style_comparison, "Unable to compare writing styles");
}

TEST(FallbackTest, WithUnparseableReplyKeepsText) {
  SemanticAnalysis analysis = MakeFallbackAnalysis("unparseable reply", "They are similar.");
  EXPECT_EQ(analysis.insights, "They are similar.");
  EXPECT_EQ(analysis.themes_text1, (std::vector<std::string>{"General content"}));
  EXPECT_DOUBLE_EQ(analysis.semantic_similarity, 0.5);
}

TEST(FallbackTest, Suggestions) {
  ImprovementSuggestions suggestions = MakeFallbackSuggestions("not configured");
  EXPECT_TRUE(suggestions.IsFallback());
  EXPECT_EQ(suggestions.fallback_reason, "not configured");
  EXPECT_EQ(suggestions.text, "No suggestions available. Please check your API key.");
}

TEST(AnalysisSourceTest, Names) {
  EXPECT_STREQ(AnalysisSourceName(AnalysisSource::kOracle), "oracle");
  EXPECT_STREQ(AnalysisSourceName(AnalysisSource::kFallback), "fallback");
}

}  // namespace
}  // namespace simlens
