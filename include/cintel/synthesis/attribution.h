#pragma once

#include "cintel/retrieval/relevance_scorer.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace cintel::synthesis {

// Post-hoc attribution of generated text to the excerpts it was given.
//
// A sentence of the text is supported by an excerpt when they share at least
// min(2, |sentence terms|) content terms. Excerpt tags such as "[C2]" in the text are ignored,
// so a provider cannot claim support it does not have.
//
// Returns the indexes of the first chunk_limit chunks that support at least one sentence,
// ascending. Empty when nothing in the text is supported.
[[nodiscard]] std::vector<std::size_t> attribute(std::string_view text,
                                                 const std::vector<retrieval::ScoredChunk>& chunks,
                                                 std::size_t chunk_limit);

}  // namespace cintel::synthesis
