#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace cintel::citation {

// [begin, end) byte span. Relative to whatever text it was computed on.
struct Span {
  std::size_t begin{0};  // NOLINT(readability-identifier-naming)
  std::size_t end{0};    // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::size_t size() const noexcept { return end - begin; }
  bool operator==(const Span&) const = default;
};

struct Sentence {
  Span span;                // NOLINT(readability-identifier-naming)
  bool terminated{false};   // NOLINT(readability-identifier-naming) ended by punctuation or a blank line
};

// Punctuation heuristics for sentence bounds in contract prose.
//
// A sentence ends after '.', '!' or '?' (plus closing quotes or brackets) when followed by
// whitespace or end of text, or at a blank line. A period does not end a sentence after
// single capital letters ("U.S."), common abbreviations ("Inc.", "No.", "e.g.") or inside
// numbers ("1.5").
//
// Returned spans exclude surrounding whitespace and cover every non-blank byte of text in
// order. The first span starts at the first non-blank byte even when the text begins
// mid-sentence.
[[nodiscard]] std::vector<Sentence> segment_sentences(std::string_view text);

// segment_sentences without the termination flags.
[[nodiscard]] std::vector<Span> split_sentences(std::string_view text);

// True when pos is the first byte of a sentence: at the start of text, or preceded by a
// sentence terminator and whitespace.
[[nodiscard]] bool starts_sentence(std::string_view text, std::size_t pos);

}  // namespace cintel::citation
