#include "cintel/synthesis/attribution.h"

#include "cintel/citation/sentence_segmenter.h"
#include "cintel/core/normalization.h"

#include <algorithm>
#include <iterator>
#include <string>

namespace cintel::synthesis {

namespace {

// "c1", "c12": tokens left over from excerpt tags.
bool is_excerpt_tag(const std::string& term) {
  return term.size() >= 2 && term[0] == 'c' &&
         std::all_of(term.begin() + 1, term.end(), [](const char ch) { return ch >= '0' && ch <= '9'; });
}

std::size_t shared_terms(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  std::vector<std::string> common;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(common));
  return common.size();
}

}  // namespace

std::vector<std::size_t> attribute(const std::string_view text,
                                   const std::vector<retrieval::ScoredChunk>& chunks,
                                   const std::size_t chunk_limit) {
  const std::size_t limit = std::min(chunk_limit, chunks.size());
  std::vector<std::vector<std::string>> chunk_terms;
  chunk_terms.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    chunk_terms.push_back(core::content_terms(chunks[i].chunk.text));
  }

  std::vector<bool> supported(limit, false);
  for (const auto& span : citation::split_sentences(text)) {
    std::vector<std::string> terms = core::content_terms(text.substr(span.begin, span.size()));
    terms.erase(std::remove_if(terms.begin(), terms.end(), is_excerpt_tag), terms.end());
    if (terms.empty()) {
      continue;
    }
    const std::size_t needed = std::min<std::size_t>(2, terms.size());
    for (std::size_t i = 0; i < limit; ++i) {
      if (!supported[i] && shared_terms(terms, chunk_terms[i]) >= needed) {
        supported[i] = true;
      }
    }
  }

  std::vector<std::size_t> indexes;
  for (std::size_t i = 0; i < limit; ++i) {
    if (supported[i]) {
      indexes.push_back(i);
    }
  }
  return indexes;
}

}  // namespace cintel::synthesis
