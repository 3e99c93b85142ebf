#pragma once

#include "cintel/core/ids.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/page.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cintel::chunking {

// Bounds on ChunkerConfig::target_size. The audit and extraction patterns run over one chunk at
// a time, and std::regex recursion depth grows with input length.
inline constexpr std::size_t kMinTargetSize = 16;
inline constexpr std::size_t kMaxTargetSize = 4096;

struct ChunkerConfig {
  std::size_t target_size{500};   // NOLINT(readability-identifier-naming) bytes per window
  double overlap_fraction{0.2};   // NOLINT(readability-identifier-naming) in [0, 0.5]
};

// Chunker splits each page into overlapping windows of at most target_size bytes.
//
// - A window ends at the last sentence or line break in its second half when there is one,
//   so chunks tend to end on complete sentences.
// - The next window starts overlap bytes before the previous end, advanced to the next word
//   start, so any phrase up to the overlap length lies whole inside some chunk.
// - Windows never cross pages, never split a UTF-8 sequence, and whitespace-only windows are
//   dropped. An empty page yields no chunks.
//
// Pure function of its input; safe to call concurrently.
class Chunker {
 public:
  // Throws std::invalid_argument for target_size outside [kMinTargetSize, kMaxTargetSize] or
  // overlap outside [0, 0.5].
  explicit Chunker(ChunkerConfig config = {});

  [[nodiscard]] std::vector<domain::Chunk> chunk(const core::DocumentId& document_id,
                                                 const std::vector<domain::Page>& pages) const;

  [[nodiscard]] const ChunkerConfig& config() const noexcept { return config_; }

  // Distinguishes cache entries made with different windowing, e.g. "500/100".
  [[nodiscard]] std::string signature() const;

 private:
  void chunk_page(const core::DocumentId& document_id, const domain::Page& page,
                  std::vector<domain::Chunk>& out) const;

  ChunkerConfig config_;
  std::size_t overlap_bytes_;
};

}  // namespace cintel::chunking
