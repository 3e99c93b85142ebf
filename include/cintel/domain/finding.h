#pragma once

#include "cintel/domain/citation.h"

#include <optional>
#include <string>
#include <string_view>

namespace cintel::domain {

// Ordered low < medium < high so findings sort by descending severity.
enum class Severity {
  kLow = 0,
  kMedium = 1,
  kHigh = 2,
};

[[nodiscard]] const char* to_string(Severity severity);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);

// One occurrence of a matched risk rule with its evidence.
struct Finding {
  std::string risk_type;      // NOLINT(readability-identifier-naming)
  Severity severity;          // NOLINT(readability-identifier-naming)
  std::string description;    // NOLINT(readability-identifier-naming)
  Citation evidence;          // NOLINT(readability-identifier-naming)
  std::string rule_version;   // NOLINT(readability-identifier-naming)

  bool operator==(const Finding&) const = default;
};

}  // namespace cintel::domain
