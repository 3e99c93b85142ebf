#include "cintel/citation/sentence_segmenter.h"

#include "cintel/core/normalization.h"

#include <algorithm>
#include <array>
#include <string>

namespace cintel::citation {

namespace {

// Lowercase, without the trailing period. Sorted.
constexpr std::array<std::string_view, 22> kAbbreviations = {
    "approx", "art", "co", "corp", "dr", "e.g", "etc", "i.e", "inc", "jr", "ltd",
    "mr",     "mrs", "ms", "no", "nos", "para", "sec", "sr", "st", "u.s", "vs",
};

bool is_closer(const char ch) {
  return ch == '"' || ch == '\'' || ch == ')' || ch == ']';
}

bool is_letter(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// The word immediately before a period at pos, including inner periods ("e.g").
bool is_abbreviation(const std::string_view text, const std::size_t pos) {
  std::size_t begin = pos;
  while (begin > 0 && (core::is_ascii_alnum(text[begin - 1]) || text[begin - 1] == '.')) {
    --begin;
  }
  const std::string_view word = text.substr(begin, pos - begin);
  if (word.size() == 1 && word[0] >= 'A' && word[0] <= 'Z') {
    return true;  // initial, as in "J. Smith" or "U.S."
  }
  if (word.empty() || !is_letter(word.front())) {
    return false;
  }
  const std::string lower = core::normalize_ascii_lower(word);
  return std::binary_search(kAbbreviations.begin(), kAbbreviations.end(), lower);
}

// End (exclusive) of the sentence closed by the punctuation at pos, or npos when the
// punctuation does not close a sentence.
std::size_t sentence_end_at(const std::string_view text, const std::size_t pos) {
  std::size_t end = pos + 1;
  while (end < text.size() && (text[end] == '.' || text[end] == '!' || text[end] == '?')) {
    ++end;
  }
  while (end < text.size() && is_closer(text[end])) {
    ++end;
  }
  if (end < text.size() && !core::is_ascii_space(text[end])) {
    return std::string_view::npos;
  }
  if (text[pos] == '.' && is_abbreviation(text, pos)) {
    return std::string_view::npos;
  }
  return end;
}

// True when the newline at pos is followed by optional blanks and another newline.
bool is_blank_line_break(const std::string_view text, const std::size_t pos) {
  std::size_t next = pos + 1;
  while (next < text.size() && (text[next] == ' ' || text[next] == '\t' || text[next] == '\r')) {
    ++next;
  }
  return next < text.size() && text[next] == '\n';
}

std::size_t trim_end(const std::string_view text, std::size_t end, const std::size_t floor) {
  while (end > floor && core::is_ascii_space(text[end - 1])) {
    --end;
  }
  return end;
}

}  // namespace

std::vector<Sentence> segment_sentences(const std::string_view text) {
  std::vector<Sentence> sentences;
  std::size_t begin = std::string_view::npos;

  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    const char ch = text[pos];
    if (begin == std::string_view::npos) {
      if (!core::is_ascii_space(ch)) {
        begin = pos;
      } else {
        continue;
      }
    }

    if (ch == '\n' && is_blank_line_break(text, pos)) {
      sentences.push_back(
          Sentence{.span = Span{begin, trim_end(text, pos, begin)}, .terminated = true});
      begin = std::string_view::npos;
      continue;
    }

    if (ch == '.' || ch == '!' || ch == '?') {
      const std::size_t end = sentence_end_at(text, pos);
      if (end != std::string_view::npos) {
        sentences.push_back(Sentence{.span = Span{begin, end}, .terminated = true});
        begin = std::string_view::npos;
        pos = end - 1;
      }
    }
  }

  if (begin != std::string_view::npos) {
    const std::size_t end = trim_end(text, text.size(), begin);
    if (end > begin) {
      sentences.push_back(Sentence{.span = Span{begin, end}, .terminated = false});
    }
  }
  return sentences;
}

std::vector<Span> split_sentences(const std::string_view text) {
  std::vector<Span> spans;
  for (const auto& sentence : segment_sentences(text)) {
    spans.push_back(sentence.span);
  }
  return spans;
}

bool starts_sentence(const std::string_view text, const std::size_t pos) {
  if (pos == 0) {
    return true;
  }
  const auto sentences = segment_sentences(text);
  for (std::size_t i = 1; i < sentences.size(); ++i) {
    if (sentences[i].span.begin == pos) {
      return sentences[i - 1].terminated;
    }
  }
  return false;
}

}  // namespace cintel::citation
