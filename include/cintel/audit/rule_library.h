#pragma once

#include "cintel/audit/risk_rule.h"
#include "cintel/audit/rule_table.h"

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace cintel::audit {

// A rule table that cannot be compiled. Fatal at startup: skipping a rule silently would
// hide risks.
class RuleLibraryError : public std::runtime_error {
 public:
  explicit RuleLibraryError(const std::string& message) : std::runtime_error(message) {}
};

// Compiled, immutable rule set. Evaluation order is vector order.
struct RuleLibrary {
  std::string library_id;                               // NOLINT(readability-identifier-naming)
  std::string version;                                  // NOLINT(readability-identifier-naming)
  std::vector<std::unique_ptr<const RiskRule>> rules;   // NOLINT(readability-identifier-naming)
};

// Compiles every row; throws RuleLibraryError naming the first bad row.
// Risk types must be unique and non-empty.
[[nodiscard]] RuleLibrary compile_rule_library(std::string library_id, std::string version,
                                               const std::vector<RuleSpec>& table);

[[nodiscard]] RuleLibrary make_default_rule_library(const RiskPolicy& policy = {});

namespace detail {

// Case-insensitive ECMAScript regex; wraps std::regex_error in RuleLibraryError.
[[nodiscard]] std::regex compile_pattern(const std::string& risk_type, const std::string& pattern);

}  // namespace detail

}  // namespace cintel::audit
