#include "cintel/audit/rule_table.h"

namespace cintel::audit {

std::vector<RuleSpec> default_rule_table(const RiskPolicy& policy) {
  using domain::Severity;

  std::vector<RuleSpec> table;

  table.push_back(RuleSpec{
      .risk_type = "auto_renewal_short_notice",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kHigh,
      .description =
          "Auto-renewal clause with only {value} days notice (policy minimum: {threshold} days)",
      .pattern =
          R"(auto(?:matic(?:ally)?)?[-\s]?renew[^.]*?(\d+)\)?\s*(?:calendar\s+|business\s+)?days?)",
      .check = NumericCheck::kLessThan,
      .threshold = policy.min_renewal_notice_days,
  });

  table.push_back(RuleSpec{
      .risk_type = "unlimited_liability",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kHigh,
      .description = "Liability is unlimited or expressly uncapped",
      .pattern = R"((?:unlimited|uncapped|no\s+limit(?:ation)?\s+(?:on|of|to)|)"
                 R"(without\s+limit(?:ation)?)[^.]*?liabilit(?:y|ies)|)"
                 R"(liabilit(?:y|ies)[^.]*?(?:shall|will)\s+)"
                 R"((?:be\s+unlimited|not\s+be\s+(?:limited|capped)))",
  });

  table.push_back(RuleSpec{
      .risk_type = "broad_indemnity",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kHigh,
      .description = "Broad indemnification covering any and all losses, claims or liabilities",
      .pattern = R"(indemnif(?:y|ies|ication)[^.]*?\b(?:any\s+and\s+all|all|any)\b[^.]*?)"
                 R"((?:loss(?:es)?|damages?|claims?|liabilit(?:y|ies)))",
  });

  // Mutual wording ("either party may terminate") is not an asymmetry.
  table.push_back(RuleSpec{
      .risk_type = "unilateral_termination",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kMedium,
      .description = "Termination rights are one-sided or withheld from a party",
      .pattern = R"((?:may\s+not|cannot)\s+terminate|(?:has|have)\s+no\s+right\s+to\s+terminate|)"
                 R"(\b(?!(?:either|each|both|any|party|parties)\b)[a-z]+\s+(?:party\s+)?)"
                 R"(may\s+terminate[^.]*?(?:at\s+any\s+time|for\s+any\s+reason|)"
                 R"(for\s+convenience|in\s+its\s+sole\s+discretion))",
  });

  table.push_back(RuleSpec{
      .risk_type = "confidentiality_survival_excessive",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kMedium,
      .description = "Confidentiality obligations survive longer than {threshold} years",
      .pattern = R"((?:confidential|non-?disclosure)[^.]*?(?:surviv\w*[^.]*?(\d+)\)?\s*years?|)"
                 R"(in\s+perpetuity|perpetual(?:ly)?|indefinitely))",
      .check = NumericCheck::kGreaterThan,
      .threshold = policy.max_confidentiality_survival_years,
  });

  table.push_back(RuleSpec{
      .risk_type = "confidentiality_survival_missing",
      .version = "1.0",
      .kind = RuleKind::kAbsence,
      .severity = Severity::kLow,
      .description = "Confidentiality obligations have no stated survival period",
      .pattern = R"(confidential|non-?disclosure)",
      .required_pattern = R"(surviv\w*|(?:continue|remain)\w*[^.]*?(?:after|following|beyond))"
                          R"([^.]*?(?:termination|expiration))",
      .min_document_bytes = policy.min_document_bytes_for_absence,
  });

  table.push_back(RuleSpec{
      .risk_type = "governing_law_absent",
      .version = "1.0",
      .kind = RuleKind::kAbsence,
      .severity = Severity::kMedium,
      .description = "No governing law or jurisdiction clause found",
      .required_pattern = R"(govern(?:ed|ing)\s+(?:by\s+)?(?:the\s+)?laws?|)"
                          R"(laws\s+of\s+the\s+(?:state|commonwealth|province)|jurisdiction|venue)",
      .min_document_bytes = policy.min_document_bytes_for_absence,
  });

  table.push_back(RuleSpec{
      .risk_type = "exclusive_terms",
      .version = "1.0",
      .kind = RuleKind::kPattern,
      .severity = Severity::kLow,
      .description = "Exclusive dealing obligation",
      .pattern = R"((?:^|[^-\w])exclusive\s[^.]*?(?:vendor|supplier|provider|distributor))",
  });

  return table;
}

}  // namespace cintel::audit
