#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace simlens {

/**
 * Read-only lexical view of one input text.
 *
 * Words are the lowercase runs of [a-z] left after every other
 * non-whitespace character has been dropped; letters are the same
 * text with whitespace dropped too.
 */
struct NormalizedText {
  std::vector<std::string> words;   // In input order, duplicates kept
  std::set<std::string> word_set;
  std::string letters;              // Cleaned [a-z] characters, in order
  std::set<char> letter_set;
};

/**
 * Build the normalized view of a raw string.
 *
 * Case folding is ASCII only. Non-ASCII code points are dropped, except
 * Unicode whitespace, which separates words. Never fails: empty or
 * invalid UTF-8 input yields a (possibly empty) view.
 */
NormalizedText Normalize(std::string_view raw);

namespace internal {

// Invalid UTF-8 bytes decode to this code point.
constexpr char32_t kReplacementChar = 0xFFFD;

/**
 * Decode UTF-8 into code points. Malformed sequences produce one
 * kReplacementChar per offending byte.
 */
std::u32string DecodeUtf8(std::string_view input);

// Encode code points back to UTF-8.
std::string EncodeUtf8(std::u32string_view input);

// Whitespace as Python's str.isspace() defines it.
bool IsUnicodeSpace(char32_t cp);

inline char32_t AsciiLower(char32_t cp) {
  return (cp >= U'A' && cp <= U'Z') ? cp + (U'a' - U'A') : cp;
}

/**
 * Lowercase any code point using the simple case mappings of a UTF-8
 * locale (as towlower(3) does). Mappings that expand to several code
 * points are not applied. Falls back to ASCII-only lowering if the
 * system has no UTF-8 locale.
 */
char32_t UnicodeLower(char32_t cp);

// Number of code points in a UTF-8 string.
size_t CodePointLength(std::string_view input);

// Strip leading and trailing Unicode whitespace.
std::string_view TrimWhitespace(std::string_view input);

// First `max_code_points` code points of input, never splitting a sequence.
std::string TruncateCodePoints(std::string_view input, size_t max_code_points);

std::vector<std::string> ExtractWords(std::string_view raw);
std::string ExtractLetters(std::string_view raw);

}  // namespace internal
}  // namespace simlens
