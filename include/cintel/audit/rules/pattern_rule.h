#pragma once

#include "cintel/audit/risk_rule.h"
#include "cintel/audit/rule_table.h"

#include <regex>
#include <string>

namespace cintel::audit {

// Fires once per regex match in each chunk, subject to the row's numeric check.
class PatternRule final : public RiskRule {
 public:
  // Throws RuleLibraryError when the pattern does not compile or the check has no group.
  explicit PatternRule(RuleSpec spec);

  [[nodiscard]] std::string_view risk_type() const noexcept override { return spec_.risk_type; }
  [[nodiscard]] std::string_view version() const noexcept override { return spec_.version; }
  [[nodiscard]] domain::Severity severity() const noexcept override { return spec_.severity; }

  [[nodiscard]] std::vector<RuleHit> evaluate(
      const std::vector<domain::Chunk>& chunks) const override;

 private:
  RuleSpec spec_;
  std::regex pattern_;
};

}  // namespace cintel::audit
