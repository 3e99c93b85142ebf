#pragma once

#include "cintel/domain/chunk.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::retrieval {

struct ScorerConfig {
  std::size_t top_k{3};            // NOLINT(readability-identifier-naming)
  double relevance_floor{0.0};     // NOLINT(readability-identifier-naming) scores must exceed it
  double synonym_weight{0.5};      // NOLINT(readability-identifier-naming)
  std::size_t proximity_window{8};  // NOLINT(readability-identifier-naming) in tokens
  double proximity_bonus{0.5};     // NOLINT(readability-identifier-naming) per extra term in window
};

struct ScoredChunk {
  domain::Chunk chunk;                      // NOLINT(readability-identifier-naming)
  double score{0.0};                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> matched_terms;   // NOLINT(readability-identifier-naming) sorted
};

struct Ranking {
  // Best first: score desc, then page, start_offset, document_id, end_offset ascending.
  std::vector<ScoredChunk> results;         // NOLINT(readability-identifier-naming)
  // False when the query had no content terms; results are then in document order.
  bool has_relevance_signal{true};          // NOLINT(readability-identifier-naming)
  std::vector<std::string> query_terms;     // NOLINT(readability-identifier-naming)
  std::vector<std::string> expansion_terms;  // NOLINT(readability-identifier-naming)
};

// RelevanceScorer ranks chunks against a question with a transparent lexical score:
//
//   score = sum over query terms t present:    (1 + ln tf) * idf(t)
//         + synonym_weight * same sum over synonym expansions of the query
//         + proximity_bonus * (most distinct query terms within any window - 1)
//   idf(t) = 1 + ln((1 + N) / (1 + df(t)))   over the N chunks passed in
//
// Stop words are dropped from the query. The result depends only on the set of chunks, not
// their order.
class RelevanceScorer {
 public:
  explicit RelevanceScorer(ScorerConfig config = {});

  [[nodiscard]] Ranking score(std::string_view query,
                              const std::vector<domain::Chunk>& chunks) const;

  [[nodiscard]] const ScorerConfig& config() const noexcept { return config_; }

  // Contract-vocabulary synonyms of terms that are not already in terms. Sorted, unique.
  [[nodiscard]] static std::vector<std::string> expand_terms(
      const std::vector<std::string>& terms);

 private:
  ScorerConfig config_;
};

}  // namespace cintel::retrieval
