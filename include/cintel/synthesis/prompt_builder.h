#pragma once

#include "cintel/retrieval/relevance_scorer.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::synthesis {

struct Prompt {
  std::string text;                 // NOLINT(readability-identifier-naming)
  std::size_t chunks_included{0};   // NOLINT(readability-identifier-naming) leading chunks, in rank order
};

// Builds a bounded question-answering prompt. Each excerpt is tagged "[C<n>]" with its
// document and page. Excerpts are added in rank order while the excerpt text stays within
// max_context_chars; the first excerpt is always included, cut at a UTF-8 boundary if needed.
[[nodiscard]] Prompt build_prompt(std::string_view question,
                                  const std::vector<retrieval::ScoredChunk>& chunks,
                                  std::size_t max_context_chars);

}  // namespace cintel::synthesis
