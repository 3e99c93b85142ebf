#pragma once

#include "cintel/core/ids.h"

#include <cstddef>
#include <string>
#include <utility>

namespace cintel::citation {
class CitationResolver;
}  // namespace cintel::citation

namespace cintel::domain {

using CharRange = std::pair<std::size_t, std::size_t>;

// Citation points at an exact span of one page's text.
// text_snippet is always the verbatim page text at char_range. Instances can only be
// created by citation::CitationResolver; everything else copies them.
class Citation {
 public:
  [[nodiscard]] const core::DocumentId& document_id() const noexcept { return document_id_; }
  [[nodiscard]] int page() const noexcept { return page_; }
  [[nodiscard]] CharRange char_range() const noexcept { return char_range_; }
  [[nodiscard]] const std::string& text_snippet() const noexcept { return text_snippet_; }

  bool operator==(const Citation&) const = default;

 private:
  friend class citation::CitationResolver;

  Citation(core::DocumentId document_id, const int page, const CharRange char_range,
           std::string text_snippet)
      : document_id_(std::move(document_id)),
        page_(page),
        char_range_(char_range),
        text_snippet_(std::move(text_snippet)) {}

  core::DocumentId document_id_;
  int page_;
  CharRange char_range_;
  std::string text_snippet_;
};

}  // namespace cintel::domain
