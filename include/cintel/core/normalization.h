#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::core {

// Locale-independent ASCII normalization. Byte-stable across platforms and compilers:
// - A-Z lowercased via explicit char math (no std::tolower)
// - any non-alphanumeric byte, including UTF-8 sequences, is a delimiter
// - tokens shorter than min_length are dropped

inline constexpr char to_ascii_lower(const char ch) {
  constexpr char kCaseOffset = 'a' - 'A';
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + kCaseOffset) : ch;
}

inline constexpr bool is_ascii_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

inline constexpr bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::string normalize_ascii_lower(std::string_view input);

// A token together with its byte position in the source text.
struct PositionedToken {
  std::string text;    // NOLINT(readability-identifier-naming)
  std::size_t begin;   // NOLINT(readability-identifier-naming)
  std::size_t end;     // NOLINT(readability-identifier-naming)
};

// Tokens in encounter order with their [begin, end) offsets in input.
std::vector<PositionedToken> tokenize_with_positions(std::string_view input,
                                                     std::size_t min_length = 2);

// Tokens in encounter order (caller sorts if needed).
std::vector<std::string> tokenize_ascii(std::string_view input, std::size_t min_length = 2);

// English function words that carry no retrieval signal ("what", "the", "of", ...).
[[nodiscard]] bool is_stop_word(std::string_view token);

// tokenize_ascii minus stop words, deduplicated and sorted.
std::vector<std::string> content_terms(std::string_view input);

// Leading and trailing ASCII whitespace removed.
std::string trim(std::string_view input);

}  // namespace cintel::core
