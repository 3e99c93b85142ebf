#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cintel::extraction {

// A value recognized in text, with its [begin, end) byte offsets in that text.
struct ValueMatch {
  std::size_t begin{0};    // NOLINT(readability-identifier-naming)
  std::size_t end{0};      // NOLINT(readability-identifier-naming)
  std::string text;        // NOLINT(readability-identifier-naming) verbatim
  std::string normalized;  // NOLINT(readability-identifier-naming)
};

// Earliest calendar date in text, normalized to ISO-8601 (YYYY-MM-DD).
// Recognizes "January 1, 2024", "Jan. 1st 2024", "1 January 2024", "1st day of January, 2024",
// "2024-01-31" and US numeric "1/31/2024" or "1-31-24" (two-digit years are 20YY).
// Impossible dates ("13/45/2024") are skipped.
[[nodiscard]] std::optional<ValueMatch> find_date(std::string_view text);

// Earliest money amount: "$1,000,000.00", "1,500 USD", "EUR 2,000". normalized is the amount
// without grouping commas followed by the ISO currency code ("1000000.00 USD").
[[nodiscard]] std::optional<ValueMatch> find_amount(std::string_view text);

// Month number for an English month name or its three-letter abbreviation, or 0.
[[nodiscard]] int month_from_name(std::string_view name);

}  // namespace cintel::extraction
