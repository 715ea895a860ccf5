// Unit tests for simlens/normalize.hpp
// Tests: UTF-8 helpers, trimming, word and letter extraction

#include <gtest/gtest.h>

#include <simlens/normalize.hpp>

#include <string>
#include <vector>

namespace simlens {
namespace {

using internal::CodePointLength;
using internal::DecodeUtf8;
using internal::EncodeUtf8;
using internal::ExtractLetters;
using internal::ExtractWords;
using internal::TrimWhitespace;
using internal::TruncateCodePoints;
using internal::UnicodeLower;

// =============================================================================
// UTF-8 Helpers
// =============================================================================

class Utf8Test : public ::testing::Test {};

TEST_F(Utf8Test, DecodesMultiByteSequences) {
  // "aé日😀"
  std::u32string decoded = DecodeUtf8("a\xC3\xA9\xE6\x97\xA5\xF0\x9F\x98\x80");
  EXPECT_EQ(decoded, (std::u32string{U'a', 0xE9, 0x65E5, 0x1F600}));
}

TEST_F(Utf8Test, EncodeInvertsDecode) {
  std::string input = "caf\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80";
  EXPECT_EQ(EncodeUtf8(DecodeUtf8(input)), input);
}

TEST_F(Utf8Test, InvalidBytesBecomeReplacementChars) {
  // Stray continuation byte, truncated sequence
  std::u32string decoded = DecodeUtf8("a\x80" "b\xE6\x97");
  ASSERT_EQ(decoded.size(), 5u);
  EXPECT_EQ(decoded[0], U'a');
  EXPECT_EQ(decoded[1], internal::kReplacementChar);
  EXPECT_EQ(decoded[2], U'b');
  EXPECT_EQ(decoded[3], internal::kReplacementChar);
  EXPECT_EQ(decoded[4], internal::kReplacementChar);
}

TEST_F(Utf8Test, RejectsOverlongAndSurrogates) {
  // Overlong '/' (C0 AF) and an encoded surrogate (ED A0 80)
  EXPECT_EQ(DecodeUtf8("\xC0\xAF")[0], internal::kReplacementChar);
  EXPECT_EQ(DecodeUtf8("\xED\xA0\x80")[0], internal::kReplacementChar);
}

TEST_F(Utf8Test, CodePointLength) {
  EXPECT_EQ(CodePointLength(""), 0u);
  EXPECT_EQ(CodePointLength("hello"), 5u);
  EXPECT_EQ(CodePointLength("caf\xC3\xA9"), 4u);
  EXPECT_EQ(CodePointLength("\xF0\x9F\x98\x80\xF0\x9F\x98\x80"), 2u);
}

TEST_F(Utf8Test, UnicodeLower) {
  EXPECT_EQ(UnicodeLower(U'A'), U'a');
  EXPECT_EQ(UnicodeLower(U'z'), U'z');
  EXPECT_EQ(UnicodeLower(U'\u00C9'), U'\u00E9');  // É
  EXPECT_EQ(UnicodeLower(U'\u0416'), U'\u0436');  // Ж
  EXPECT_EQ(UnicodeLower(U'\u03A3'), U'\u03C3');  // Σ
  EXPECT_EQ(UnicodeLower(U'\u00E9'), U'\u00E9');
  EXPECT_EQ(UnicodeLower(U'\U0001F600'), U'\U0001F600');
}

TEST_F(Utf8Test, TruncateNeverSplitsSequences) {
  std::string input = "\xC3\xA9\xC3\xA9\xC3\xA9";  // "ééé"
  EXPECT_EQ(TruncateCodePoints(input, 2), "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(TruncateCodePoints(input, 0), "");
  EXPECT_EQ(TruncateCodePoints(input, 10), input);
  EXPECT_EQ(TruncateCodePoints("abcdef", 3), "abc");
}

// =============================================================================
// Trimming
// =============================================================================

class TrimTest : public ::testing::Test {};

TEST_F(TrimTest, StripsAsciiWhitespace) {
  EXPECT_EQ(TrimWhitespace("  hello world \t\n"), "hello world");
  EXPECT_EQ(TrimWhitespace("hello"), "hello");
}

TEST_F(TrimTest, StripsUnicodeWhitespace) {
  // NBSP and ideographic space
  EXPECT_EQ(TrimWhitespace("\xC2\xA0" "abc" "\xE3\x80\x80"), "abc");
}

TEST_F(TrimTest, BlankInputBecomesEmpty) {
  EXPECT_TRUE(TrimWhitespace("").empty());
  EXPECT_TRUE(TrimWhitespace(" \t\r\n ").empty());
  EXPECT_TRUE(TrimWhitespace("\xE2\x80\x83").empty());  // Em space
}

TEST_F(TrimTest, KeepsInteriorWhitespace) {
  EXPECT_EQ(TrimWhitespace(" a  b "), "a  b");
}

// =============================================================================
// Word Extraction
// =============================================================================

class ExtractWordsTest : public ::testing::Test {};

TEST_F(ExtractWordsTest, LowercasesAndSplitsOnWhitespace) {
  EXPECT_EQ(ExtractWords("The Cat\tSAT\non the mat"),
            (std::vector<std::string>{"the", "cat", "sat", "on", "the", "mat"}));
}

TEST_F(ExtractWordsTest, DropsPunctuationInsideWords) {
  EXPECT_EQ(ExtractWords("don't stop-believing!"),
            (std::vector<std::string>{"dont", "stopbelieving"}));
}

TEST_F(ExtractWordsTest, DigitsAreNotLetters) {
  EXPECT_EQ(ExtractWords("abc123 456 x9y"),
            (std::vector<std::string>{"abc", "xy"}));
}

TEST_F(ExtractWordsTest, PunctuationOnlyYieldsNoWords) {
  EXPECT_TRUE(ExtractWords("!!! ??? 123").empty());
  EXPECT_TRUE(ExtractWords("").empty());
}

TEST_F(ExtractWordsTest, NonAsciiLettersAreDropped) {
  // "café naïve" -> "caf", "nave"
  EXPECT_EQ(ExtractWords("caf\xC3\xA9 na\xC3\xAFve"),
            (std::vector<std::string>{"caf", "nave"}));
}

TEST_F(ExtractWordsTest, UnicodeWhitespaceSeparatesWords) {
  EXPECT_EQ(ExtractWords("one\xC2\xA0two\xE3\x80\x80three"),
            (std::vector<std::string>{"one", "two", "three"}));
}

// =============================================================================
// Normalize
// =============================================================================

class NormalizeTest : public ::testing::Test {};

TEST_F(NormalizeTest, BuildsSetsFromSequences) {
  NormalizedText text = Normalize("The cat and the hat");
  EXPECT_EQ(text.words.size(), 5u);
  EXPECT_EQ(text.word_set, (std::set<std::string>{"and", "cat", "hat", "the"}));
  EXPECT_EQ(text.letters, "thecatandthehat");
  EXPECT_EQ(text.letter_set, (std::set<char>{'a', 'c', 'd', 'e', 'h', 'n', 't'}));
}

TEST_F(NormalizeTest, LettersIgnoreWhitespaceAndPunctuation) {
  EXPECT_EQ(ExtractLetters("A b, C!\n1"), "abc");
}

TEST_F(NormalizeTest, EmptyInputIsEmptyView) {
  NormalizedText text = Normalize("");
  EXPECT_TRUE(text.words.empty());
  EXPECT_TRUE(text.word_set.empty());
  EXPECT_TRUE(text.letters.empty());
  EXPECT_TRUE(text.letter_set.empty());
}

TEST_F(NormalizeTest, InvalidUtf8DoesNotFail) {
  NormalizedText text = Normalize("ab\xFF\xFE" "cd ef");
  EXPECT_EQ(text.words, (std::vector<std::string>{"abcd", "ef"}));
}

}  // namespace
}  // namespace simlens
