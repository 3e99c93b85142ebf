#pragma once

#include "cintel/citation/sentence_segmenter.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/citation.h"

#include <optional>

namespace cintel::citation {

enum class BoundaryPolicy {
  kExact,     // cite the given span as is
  kSentence,  // widen the span to the sentence(s) enclosing it
};

// CitationResolver is the only producer of domain::Citation. Answers, audit findings and
// extracted fields all cite through it, so their evidence is computed identically.
//
// Offsets: char_range = chunk.start_offset + span within chunk. Since chunk.text is the exact
// page substring at its offsets, text_snippet is the exact page substring at char_range.
class CitationResolver {
 public:
  explicit CitationResolver(BoundaryPolicy policy = BoundaryPolicy::kSentence)
      : policy_(policy) {}

  // span is relative to chunk.text. Throws std::invalid_argument if it is empty or does not
  // fit inside the chunk.
  //
  // Without a span the chunk is trimmed to the complete sentences it contains; when it
  // contains none, the whole chunk is cited.
  [[nodiscard]] domain::Citation resolve(const domain::Chunk& chunk,
                                         std::optional<Span> span = std::nullopt) const;

  [[nodiscard]] BoundaryPolicy policy() const noexcept { return policy_; }

 private:
  [[nodiscard]] Span expand_to_sentences(const domain::Chunk& chunk, Span span) const;
  [[nodiscard]] Span complete_sentences(const domain::Chunk& chunk) const;

  BoundaryPolicy policy_;
};

}  // namespace cintel::citation
