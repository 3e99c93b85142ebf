#pragma once

#include "cintel/domain/finding.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cintel::audit {

constexpr const char* kDefaultRuleLibraryId = "contract-risk";
constexpr const char* kDefaultRuleLibraryVersion = "1.0.0";

// Product policy thresholds referenced by the rule table.
struct RiskPolicy {
  int min_renewal_notice_days{30};           // NOLINT(readability-identifier-naming)
  int max_confidentiality_survival_years{5};  // NOLINT(readability-identifier-naming)
  // Absence rules only judge documents at least this long; excerpts cannot be faulted for
  // clauses they were never meant to contain.
  std::size_t min_document_bytes_for_absence{1000};  // NOLINT(readability-identifier-naming)
};

enum class RuleKind {
  kPattern,  // one hit per pattern match
  kAbsence,  // one hit when required_pattern matches nowhere in the document
};

// Secondary check on capture group 1 of a pattern match. Matches whose group 1 did not
// participate (e.g. a "perpetual" alternative) pass the check.
enum class NumericCheck {
  kNone,
  kLessThan,
  kGreaterThan,
};

// One declarative row of the rule library. Patterns are ECMAScript regular expressions
// matched case-insensitively against chunk text.
//
// description may contain {value} (the captured number) and {threshold}.
//
// For kAbsence rules, pattern is the anchor whose first match is cited as evidence and
// gates the rule (no anchor match, no finding). An empty anchor cites the opening sentence
// of the document.
struct RuleSpec {
  std::string risk_type;         // NOLINT(readability-identifier-naming)
  std::string version;           // NOLINT(readability-identifier-naming)
  RuleKind kind{RuleKind::kPattern};  // NOLINT(readability-identifier-naming)
  domain::Severity severity{domain::Severity::kMedium};  // NOLINT(readability-identifier-naming)
  std::string description;       // NOLINT(readability-identifier-naming)
  std::string pattern;           // NOLINT(readability-identifier-naming)
  std::string required_pattern;  // NOLINT(readability-identifier-naming)
  NumericCheck check{NumericCheck::kNone};  // NOLINT(readability-identifier-naming)
  long threshold{0};             // NOLINT(readability-identifier-naming)
  std::size_t min_document_bytes{0};  // NOLINT(readability-identifier-naming) kAbsence only
};

// The built-in table, thresholds substituted from policy. Rows are in evaluation order.
[[nodiscard]] std::vector<RuleSpec> default_rule_table(const RiskPolicy& policy);

}  // namespace cintel::audit
