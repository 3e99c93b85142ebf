#pragma once

#include "cintel/core/ids.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cintel::domain {

// Chunk is a position-tracked substring of a single page.
// Invariant: page_text.substr(start_offset, end_offset - start_offset) == text,
// with 0 <= start_offset < end_offset <= page_text.size().
struct Chunk {
  core::DocumentId document_id;  // NOLINT(readability-identifier-naming)
  int page{1};                   // NOLINT(readability-identifier-naming)
  std::size_t start_offset{0};   // NOLINT(readability-identifier-naming)
  std::size_t end_offset{0};     // NOLINT(readability-identifier-naming)
  std::string text;              // NOLINT(readability-identifier-naming)

  bool operator==(const Chunk&) const = default;
};

using ChunkList = std::vector<Chunk>;

}  // namespace cintel::domain
