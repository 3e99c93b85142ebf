#include "cintel/extraction/value_parsers.h"

#include "cintel/core/normalization.h"

#include <array>
#include <charconv>
#include <cstdio>
#include <regex>

namespace cintel::extraction {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

// Full names before abbreviations so the longest alternative is taken.
constexpr const char* kMonthGroup =
    "(January|February|March|April|May|June|July|August|September|October|November|"
    "December|Jan|Feb|Mar|Apr|Jun|Jul|Aug|Sept|Sep|Oct|Nov|Dec)";

enum class DateLayout { kMonthDayYear, kDayMonthYear, kIso, kUsNumeric };

struct DatePattern {
  DateLayout layout;
  std::regex re;
};

const std::array<DatePattern, 4>& date_patterns() {
  static const std::array<DatePattern, 4> patterns{{
      {DateLayout::kMonthDayYear,
       std::regex(std::string(R"(\b)") + kMonthGroup +
                      R"(\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})\b)",
                  kFlags)},
      {DateLayout::kDayMonthYear,
       std::regex(std::string(R"(\b(\d{1,2})(?:st|nd|rd|th)?\s+(?:day\s+of\s+)?)") +
                      kMonthGroup + R"(\.?,?\s+(\d{4})\b)",
                  kFlags)},
      {DateLayout::kIso, std::regex(R"(\b(\d{4})-(\d{2})-(\d{2})\b)", kFlags)},
      {DateLayout::kUsNumeric, std::regex(R"(\b(\d{1,2})[/-](\d{1,2})[/-](\d{4}|\d{2})\b)", kFlags)},
  }};
  return patterns;
}

int to_int(const std::csub_match& group) {
  int value = 0;
  std::from_chars(group.first, group.second, value);
  return value;
}

bool is_valid_date(const int year, const int month, const int day) {
  constexpr std::array<int, 12> kDaysInMonth{31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (year < 1000 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  if (month == 2 && day == 29) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  }
  return day <= kDaysInMonth[static_cast<size_t>(month - 1)];
}

std::string iso_date(const int year, const int month, const int day) {
  std::array<char, 16> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%04d-%02d-%02d", year, month, day);
  return std::string(buffer.data());
}

// {year, month, day} of a date match, or an invalid triple.
std::array<int, 3> date_parts(const DateLayout layout, const std::cmatch& m) {
  switch (layout) {
    case DateLayout::kMonthDayYear:
      return {to_int(m[3]), month_from_name(std::string_view(m[1].first, m[1].length())),
              to_int(m[2])};
    case DateLayout::kDayMonthYear:
      return {to_int(m[3]), month_from_name(std::string_view(m[2].first, m[2].length())),
              to_int(m[1])};
    case DateLayout::kIso:
      return {to_int(m[1]), to_int(m[2]), to_int(m[3])};
    case DateLayout::kUsNumeric: {
      int year = to_int(m[3]);
      if (m[3].length() == 2) {
        year += 2000;
      }
      return {year, to_int(m[1]), to_int(m[2])};
    }
  }
  return {0, 0, 0};
}

std::string strip_grouping(const std::csub_match& integer_part) {
  std::string digits;
  for (const char* p = integer_part.first; p != integer_part.second; ++p) {
    if (*p != ',') {
      digits.push_back(*p);
    }
  }
  return digits;
}

std::string upper_ascii(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

}  // namespace

int month_from_name(const std::string_view name) {
  static constexpr std::array<std::string_view, 12> kMonths{
      "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
  if (name.size() < 3) {
    return 0;
  }
  const std::string lowered = core::normalize_ascii_lower(name.substr(0, 3));
  for (size_t i = 0; i < kMonths.size(); ++i) {
    if (lowered == kMonths[i]) {
      return static_cast<int>(i) + 1;
    }
  }
  return 0;
}

std::optional<ValueMatch> find_date(const std::string_view text) {
  std::optional<ValueMatch> best;
  const char* const first = text.data();
  const char* const last = text.data() + text.size();

  for (const auto& pattern : date_patterns()) {
    for (std::cregex_iterator it(first, last, pattern.re), end; it != end; ++it) {
      const std::cmatch& m = *it;
      const auto begin = static_cast<size_t>(m.position(0));
      if (best.has_value() && begin >= best->begin) {
        break;
      }
      const auto [year, month, day] = date_parts(pattern.layout, m);
      if (!is_valid_date(year, month, day)) {
        continue;
      }
      best = ValueMatch{begin, begin + static_cast<size_t>(m.length(0)), m.str(0),
                        iso_date(year, month, day)};
      break;
    }
  }
  return best;
}

std::optional<ValueMatch> find_amount(const std::string_view text) {
  // Group layout per pattern: {integer, cents, currency}; currency 0 means US dollars.
  struct AmountPattern {
    std::regex re;
    std::size_t integer_group;
    std::size_t cents_group;
    std::size_t currency_group;
  };
  static const std::array<AmountPattern, 3> patterns{{
      {std::regex(R"(\$\s?(\d{1,3}(?:,\d{3})+|\d+)(?:\.(\d{2}))?)", kFlags), 1, 2, 0},
      {std::regex(R"(\b(\d{1,3}(?:,\d{3})+|\d+)(?:\.(\d{2}))?\s*(USD|EUR|GBP)\b)", kFlags), 1, 2,
       3},
      {std::regex(R"(\b(USD|EUR|GBP)\s*(\d{1,3}(?:,\d{3})+|\d+)(?:\.(\d{2}))?)", kFlags), 2, 3, 1},
  }};

  std::optional<ValueMatch> best;
  const char* const first = text.data();
  const char* const last = text.data() + text.size();
  for (const auto& pattern : patterns) {
    std::cmatch m;
    if (!std::regex_search(first, last, m, pattern.re)) {
      continue;
    }
    const auto begin = static_cast<size_t>(m.position(0));
    if (best.has_value() && begin >= best->begin) {
      continue;
    }
    std::string normalized = strip_grouping(m[pattern.integer_group]);
    if (m[pattern.cents_group].matched) {
      normalized += "." + m[pattern.cents_group].str();
    }
    const std::string currency = pattern.currency_group == 0
                                     ? std::string("USD")
                                     : upper_ascii(m[pattern.currency_group].str());
    best = ValueMatch{begin, begin + static_cast<size_t>(m.length(0)), m.str(0),
                      normalized + " " + currency};
  }
  return best;
}

}  // namespace cintel::extraction
