#include "cintel/citation/citation_resolver.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace cintel::citation {

domain::Citation CitationResolver::resolve(const domain::Chunk& chunk,
                                           const std::optional<Span> span) const {
  Span local;
  if (span.has_value()) {
    if (span->begin >= span->end || span->end > chunk.text.size()) {
      throw std::invalid_argument("citation span [" + std::to_string(span->begin) + ", " +
                                  std::to_string(span->end) + ") outside chunk of " +
                                  std::to_string(chunk.text.size()) + " bytes");
    }
    local = policy_ == BoundaryPolicy::kSentence ? expand_to_sentences(chunk, *span) : *span;
  } else {
    local = complete_sentences(chunk);
  }

  return domain::Citation(
      chunk.document_id, chunk.page,
      domain::CharRange{chunk.start_offset + local.begin, chunk.start_offset + local.end},
      chunk.text.substr(local.begin, local.size()));
}

Span CitationResolver::expand_to_sentences(const domain::Chunk& chunk, const Span span) const {
  Span widened = span;
  for (const Span& sentence : split_sentences(chunk.text)) {
    if (sentence.begin <= span.begin && span.begin < sentence.end) {
      widened.begin = std::min(widened.begin, sentence.begin);
    }
    if (sentence.begin < span.end && span.end <= sentence.end) {
      widened.end = std::max(widened.end, sentence.end);
    }
  }
  return widened;
}

Span CitationResolver::complete_sentences(const domain::Chunk& chunk) const {
  const Span whole{0, chunk.text.size()};
  auto sentences = segment_sentences(chunk.text);
  if (sentences.empty()) {
    return whole;
  }

  // Text before the first sentence break belongs to a sentence that began on an earlier
  // chunk unless this chunk opens the page.
  std::size_t first = 0;
  if (chunk.start_offset != 0 && sentences.size() > 1) {
    first = 1;
  }
  std::size_t last = sentences.size() - 1;
  if (!sentences[last].terminated && last > first) {
    --last;
  }
  if (first > last) {
    return whole;
  }
  return Span{sentences[first].span.begin, sentences[last].span.end};
}

}  // namespace cintel::citation
