#include "cintel/core/normalization.h"

#include <algorithm>
#include <array>

namespace cintel::core {

namespace {

// Sorted for binary search.
constexpr std::array<std::string_view, 64> kStopWords = {
    "about", "after", "all",   "also",  "an",    "and",   "any",   "are",   "as",    "at",
    "be",    "been",  "but",   "by",    "can",   "could", "did",   "do",    "does",  "for",
    "from",  "had",   "has",   "have",  "how",   "if",    "in",    "into",  "is",    "it",
    "its",   "may",   "me",    "more",  "my",    "no",    "not",   "of",    "on",    "or",
    "our",   "should", "so",   "such",  "than",  "that",  "the",   "their", "them",  "then",
    "there", "these", "they",  "this",  "to",    "was",   "we",    "were",  "what",  "when",
    "where", "which", "who",   "with",
};

}  // namespace

std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(to_ascii_lower(ch));
  }
  return result;
}

std::vector<PositionedToken> tokenize_with_positions(const std::string_view input,
                                                     const std::size_t min_length) {
  std::vector<PositionedToken> tokens;
  std::size_t pos = 0;
  while (pos < input.size()) {
    if (!is_ascii_alnum(input[pos])) {
      ++pos;
      continue;
    }
    const std::size_t begin = pos;
    std::string token;
    while (pos < input.size() && is_ascii_alnum(input[pos])) {
      token.push_back(to_ascii_lower(input[pos]));
      ++pos;
    }
    if (token.size() >= min_length) {
      tokens.push_back(PositionedToken{.text = std::move(token), .begin = begin, .end = pos});
    }
  }
  return tokens;
}

std::vector<std::string> tokenize_ascii(const std::string_view input,
                                        const std::size_t min_length) {
  std::vector<std::string> tokens;
  for (auto& token : tokenize_with_positions(input, min_length)) {
    tokens.push_back(std::move(token.text));
  }
  return tokens;
}

bool is_stop_word(const std::string_view token) {
  return std::binary_search(kStopWords.begin(), kStopWords.end(), token);
}

std::vector<std::string> content_terms(const std::string_view input) {
  std::vector<std::string> terms = tokenize_ascii(input);
  terms.erase(std::remove_if(terms.begin(), terms.end(),
                             [](const std::string& t) { return is_stop_word(t); }),
              terms.end());
  std::sort(terms.begin(), terms.end());
  terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
  return terms;
}

std::string trim(const std::string_view input) {
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

}  // namespace cintel::core
