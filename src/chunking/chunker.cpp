#include "cintel/chunking/chunker.h"

#include "cintel/core/normalization.h"
#include "cintel/core/utf8.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cintel::chunking {

namespace {

bool is_blank(const std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char ch) { return core::is_ascii_space(ch); });
}

}  // namespace

Chunker::Chunker(ChunkerConfig config) : config_(config) {
  if (config_.target_size < kMinTargetSize) {
    throw std::invalid_argument("chunk target_size must be at least " +
                                std::to_string(kMinTargetSize));
  }
  if (config_.target_size > kMaxTargetSize) {
    throw std::invalid_argument("chunk target_size must be at most " +
                                std::to_string(kMaxTargetSize));
  }
  if (!(config_.overlap_fraction >= 0.0 && config_.overlap_fraction <= 0.5)) {
    throw std::invalid_argument("chunk overlap_fraction must be within [0, 0.5]");
  }
  overlap_bytes_ = static_cast<std::size_t>(
      std::floor(static_cast<double>(config_.target_size) * config_.overlap_fraction));
}

std::string Chunker::signature() const {
  return std::to_string(config_.target_size) + "/" + std::to_string(overlap_bytes_);
}

std::vector<domain::Chunk> Chunker::chunk(const core::DocumentId& document_id,
                                          const std::vector<domain::Page>& pages) const {
  std::vector<const domain::Page*> ordered;
  ordered.reserve(pages.size());
  for (const auto& page : pages) {
    ordered.push_back(&page);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const domain::Page* a, const domain::Page* b) {
                     return a->page_number < b->page_number;
                   });

  std::vector<domain::Chunk> chunks;
  for (const domain::Page* page : ordered) {
    chunk_page(document_id, *page, chunks);
  }
  return chunks;
}

void Chunker::chunk_page(const core::DocumentId& document_id, const domain::Page& page,
                         std::vector<domain::Chunk>& out) const {
  const std::string_view text = page.text;
  const std::size_t size = config_.target_size;
  std::size_t start = 0;

  while (start < text.size()) {
    std::size_t end = std::min(start + size, text.size());

    if (end < text.size()) {
      const std::string_view window = text.substr(start, end - start);
      const std::size_t brk = window.find_last_of(".!?\n");
      if (brk != std::string_view::npos && brk >= size / 2) {
        end = start + brk + 1;
      }
      end = core::utf8_floor(text, end);
      if (end <= start) {
        end = core::utf8_ceil(text, start + 1);
      }
    }

    const std::string_view piece = text.substr(start, end - start);
    if (!is_blank(piece)) {
      out.push_back(domain::Chunk{
          .document_id = document_id,
          .page = page.page_number,
          .start_offset = start,
          .end_offset = end,
          .text = std::string(piece),
      });
    }

    if (end >= text.size()) {
      break;
    }

    const std::size_t overlap = std::min(end, overlap_bytes_);
    std::size_t next = core::utf8_ceil(text, std::max(start + 1, end - overlap));
    if (next > 0 && next < end && !core::is_ascii_space(text[next - 1])) {
      // Mid-word: move to the start of the following word if it is inside the overlap.
      std::size_t p = next;
      while (p < end && !core::is_ascii_space(text[p])) {
        ++p;
      }
      if (p < end) {
        next = p;
      }
    }
    while (next < end && core::is_ascii_space(text[next])) {
      ++next;
    }
    start = next;
  }
}

}  // namespace cintel::chunking
