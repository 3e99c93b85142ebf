#pragma once

#include <string>
#include <vector>

namespace cintel::domain {

// One page of extracted document text. page_number is 1-based.
// Page text is the coordinate space of every chunk offset and citation char_range.
struct Page {
  int page_number{1};  // NOLINT(readability-identifier-naming)
  std::string text;    // NOLINT(readability-identifier-naming)

  bool operator==(const Page&) const = default;
};

using PageList = std::vector<Page>;

}  // namespace cintel::domain
