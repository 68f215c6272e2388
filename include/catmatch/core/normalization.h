#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catmatch::core {

// Deterministic ASCII-oriented normalization for product descriptions.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// Rules:
// - ASCII lowercasing: A-Z -> a-z via explicit char math (no std::tolower)
// - Known transcription typos corrected by literal substring substitution
// - Anything that is not a word byte or whitespace -> space
// - Common UTF-8 punctuation (curly quotes, dashes, ellipsis, nbsp, guillemets)
//   -> space, like its ASCII counterpart
// - Whitespace runs collapse to a single space, no leading/trailing space
//
// A word byte is [a-z0-9_] or any byte >= 0x80 that does not start one of the
// punctuation sequences above (other UTF-8 letters pass through).

// kTypoCorrections lists (misspelling, correction) pairs seen in vendor feeds.
// No correction may contain its own misspelling, which keeps the
// substitution pass terminating and normalization idempotent.
inline constexpr std::array<std::pair<std::string_view, std::string_view>, 2> kTypoCorrections{{
    {"santals", "sandals"},
    {"naavy", "navy"},
}};

inline bool is_word_byte(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '_' || byte >= 0x80;
}

// utf8_punctuation_length returns the byte length of the UTF-8 punctuation
// or space sequence starting at pos, or 0 if there is none.
// Covered: U+00A0..U+00BF except letter-like and digit-like signs,
// U+00D7, U+00F7, U+2000..U+206F (General Punctuation), U+3000..U+3003.
inline std::size_t utf8_punctuation_length(const std::string_view text, const std::size_t pos) {
  if (pos + 1 >= text.size()) {
    return 0;
  }
  const auto b0 = static_cast<unsigned char>(text[pos]);
  const auto b1 = static_cast<unsigned char>(text[pos + 1]);

  if (b0 == 0xC2 && b1 >= 0xA0 && b1 <= 0xBF) {
    // ª µ º are letters, ² ³ ¹ ¼ ½ ¾ are numbers
    constexpr std::string_view kWordLike = "\xAA\xB2\xB3\xB5\xB9\xBA\xBC\xBD\xBE";
    return kWordLike.find(static_cast<char>(b1)) == std::string_view::npos ? 2 : 0;
  }
  if (b0 == 0xC3 && (b1 == 0x97 || b1 == 0xB7)) {
    return 2;
  }

  if (pos + 2 >= text.size()) {
    return 0;
  }
  const auto b2 = static_cast<unsigned char>(text[pos + 2]);
  if (b0 == 0xE2 && ((b1 == 0x80 && b2 >= 0x80 && b2 <= 0xBF) ||
                     (b1 == 0x81 && b2 >= 0x80 && b2 <= 0xAF))) {
    return 3;
  }
  if (b0 == 0xE3 && b1 == 0x80 && b2 >= 0x80 && b2 <= 0x83) {
    return 3;
  }
  return 0;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// correct_typos rewrites every occurrence of a known misspelling, repeating
// until no misspelling is left.
inline std::string correct_typos(std::string text) {
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& [typo, fix] : kTypoCorrections) {
      std::size_t pos = text.find(typo);
      while (pos != std::string::npos) {
        text.replace(pos, typo.size(), fix);
        changed = true;
        pos = text.find(typo, pos + fix.size());
      }
    }
  }
  return text;
}

// normalize_description is the canonical form used for both attribute
// extraction and text similarity.
// normalize_description(normalize_description(x)) == normalize_description(x).
inline std::string normalize_description(const std::string_view input) {
  const std::string corrected = correct_typos(normalize_ascii_lower(input));

  std::string result;
  result.reserve(corrected.size());

  bool pending_space = false;
  std::size_t i = 0;
  while (i < corrected.size()) {
    const std::size_t punctuation = utf8_punctuation_length(corrected, i);
    if (punctuation > 0) {
      pending_space = true;
      i += punctuation;
      continue;
    }

    const char ch = corrected[i];
    if (is_word_byte(ch)) {
      if (pending_space && !result.empty()) {
        result.push_back(' ');
      }
      pending_space = false;
      result.push_back(ch);
    } else {
      // Punctuation and whitespace both act as a single delimiter
      pending_space = true;
    }
    ++i;
  }

  return result;
}

// tokenize_ascii splits input into word tokens.
// - Lowercases and normalizes via normalize_description
// - Drops tokens shorter than min_length
// - Returns tokens in encounter order (duplicates kept; callers count them)
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  const std::string normalized = normalize_description(input);

  std::vector<std::string> tokens;
  std::string current_token;

  for (const char ch : normalized) {
    if (ch == ' ') {
      if (current_token.size() >= min_length) {
        tokens.push_back(std::move(current_token));
      }
      current_token.clear();
    } else {
      current_token.push_back(ch);
    }
  }

  if (current_token.size() >= min_length) {
    tokens.push_back(std::move(current_token));
  }

  return tokens;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace catmatch::core
