#include <simlens/normalize.hpp>

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <locale>
#include <stdexcept>
#include <utility>

namespace simlens::internal {

namespace {

const char* const kUtf8Locales[] = {"C.UTF-8", "C.utf8", "en_US.UTF-8"};

std::locale LoadUtf8Locale() {
  for (const char* name : kUtf8Locales) {
    try {
      return std::locale(name);
    } catch (const std::runtime_error&) {
      // Not installed; try the next one
    }
  }
  LOG_WARN << "No UTF-8 locale available; case folding is ASCII only";
  return std::locale::classic();
}

const std::ctype<wchar_t>& WideCtype() {
  static const std::locale locale = LoadUtf8Locale();
  return std::use_facet<std::ctype<wchar_t>>(locale);
}

inline int UTF8ByteLength(uint8_t first_byte) {
  if ((first_byte & 0x80) == 0) return 1;      // 0xxxxxxx
  if ((first_byte & 0xE0) == 0xC0) return 2;   // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0) return 3;   // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0) return 4;   // 11110xxx
  return 0;  // Stray continuation byte or invalid lead
}

// Decode the sequence starting at input[i]. Returns the number of bytes
// consumed (always >= 1) and stores the code point in *cp.
size_t DecodeAt(std::string_view input, size_t i, char32_t* cp) {
  uint8_t c = static_cast<uint8_t>(input[i]);
  int len = UTF8ByteLength(c);

  if (len == 1) {
    *cp = c;
    return 1;
  }
  if (len == 0 || i + len > input.size()) {
    *cp = kReplacementChar;
    return 1;
  }

  char32_t value = c & (0xFF >> (len + 1));
  for (int j = 1; j < len; ++j) {
    uint8_t cont = static_cast<uint8_t>(input[i + j]);
    if ((cont & 0xC0) != 0x80) {
      *cp = kReplacementChar;
      return 1;
    }
    value = (value << 6) | (cont & 0x3F);
  }

  // Reject overlong forms, surrogates and values past U+10FFFF
  static constexpr char32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};
  if (value < kMinForLength[len] || value > 0x10FFFF ||
      (value >= 0xD800 && value <= 0xDFFF)) {
    *cp = kReplacementChar;
    return 1;
  }

  *cp = value;
  return static_cast<size_t>(len);
}

inline bool IsAsciiLetter(char32_t cp) { return cp >= U'a' && cp <= U'z'; }

}  // namespace

std::u32string DecodeUtf8(std::string_view input) {
  std::u32string out;
  out.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    char32_t cp = 0;
    i += DecodeAt(input, i, &cp);
    out.push_back(cp);
  }
  return out;
}

std::string EncodeUtf8(std::u32string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char32_t cp : input) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }
  return out;
}

bool IsUnicodeSpace(char32_t cp) {
  if (cp < 0x80) {
    return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F);
  }
  switch (cp) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

char32_t UnicodeLower(char32_t cp) {
  if (cp < 0x80) return AsciiLower(cp);
  if (sizeof(wchar_t) < 4 && cp > 0xFFFF) return cp;
  return static_cast<char32_t>(WideCtype().tolower(static_cast<wchar_t>(cp)));
}

size_t CodePointLength(std::string_view input) {
  size_t count = 0;
  size_t i = 0;
  while (i < input.size()) {
    char32_t cp = 0;
    i += DecodeAt(input, i, &cp);
    ++count;
  }
  return count;
}

std::string_view TrimWhitespace(std::string_view input) {
  size_t begin = input.size();
  size_t end = 0;

  size_t i = 0;
  while (i < input.size()) {
    char32_t cp = 0;
    size_t len = DecodeAt(input, i, &cp);
    if (!IsUnicodeSpace(cp)) {
      if (begin == input.size()) begin = i;
      end = i + len;
    }
    i += len;
  }

  if (begin == input.size()) return input.substr(0, 0);
  return input.substr(begin, end - begin);
}

std::string TruncateCodePoints(std::string_view input, size_t max_code_points) {
  size_t i = 0;
  size_t count = 0;
  while (i < input.size() && count < max_code_points) {
    char32_t cp = 0;
    i += DecodeAt(input, i, &cp);
    ++count;
  }
  return std::string(input.substr(0, i));
}

std::vector<std::string> ExtractWords(std::string_view raw) {
  std::vector<std::string> words;
  std::string current;

  size_t i = 0;
  while (i < raw.size()) {
    char32_t cp = 0;
    i += DecodeAt(raw, i, &cp);
    cp = AsciiLower(cp);

    if (IsAsciiLetter(cp)) {
      current += static_cast<char>(cp);
    } else if (IsUnicodeSpace(cp)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    }
    // Anything else is removed without breaking the word: "don't" -> "dont"
  }

  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::string ExtractLetters(std::string_view raw) {
  std::string letters;
  letters.reserve(raw.size());
  for (char c : raw) {
    char32_t lower = AsciiLower(static_cast<uint8_t>(c));
    // Multi-byte sequences only contain bytes >= 0x80, never a letter
    if (IsAsciiLetter(lower)) {
      letters += static_cast<char>(lower);
    }
  }
  return letters;
}

}  // namespace simlens::internal

namespace simlens {

NormalizedText Normalize(std::string_view raw) {
  NormalizedText text;
  text.words = internal::ExtractWords(raw);
  text.word_set.insert(text.words.begin(), text.words.end());
  text.letters = internal::ExtractLetters(raw);
  text.letter_set.insert(text.letters.begin(), text.letters.end());
  return text;
}

}  // namespace simlens
