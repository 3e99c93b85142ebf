#include "cintel/audit/rule_library.h"

#include "cintel/audit/rules/absence_rule.h"
#include "cintel/audit/rules/pattern_rule.h"

#include <set>

namespace cintel::audit {

namespace detail {

std::regex compile_pattern(const std::string& risk_type, const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
  } catch (const std::regex_error& e) {
    throw RuleLibraryError("rule " + risk_type + ": invalid pattern '" + pattern +
                           "': " + e.what());
  }
}

}  // namespace detail

RuleLibrary compile_rule_library(std::string library_id, std::string version,
                                 const std::vector<RuleSpec>& table) {
  RuleLibrary library;
  library.library_id = std::move(library_id);
  library.version = std::move(version);

  std::set<std::string> seen;
  for (const auto& spec : table) {
    if (spec.risk_type.empty()) {
      throw RuleLibraryError("rule library " + library.library_id + ": row without risk_type");
    }
    if (!seen.insert(spec.risk_type).second) {
      throw RuleLibraryError("rule library " + library.library_id + ": duplicate risk_type " +
                             spec.risk_type);
    }
    switch (spec.kind) {
      case RuleKind::kPattern:
        library.rules.push_back(std::make_unique<PatternRule>(spec));
        break;
      case RuleKind::kAbsence:
        library.rules.push_back(std::make_unique<AbsenceRule>(spec));
        break;
    }
  }
  return library;
}

RuleLibrary make_default_rule_library(const RiskPolicy& policy) {
  return compile_rule_library(kDefaultRuleLibraryId, kDefaultRuleLibraryVersion,
                              default_rule_table(policy));
}

}  // namespace cintel::audit
