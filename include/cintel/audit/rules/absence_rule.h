#pragma once

#include "cintel/audit/risk_rule.h"
#include "cintel/audit/rule_table.h"

#include <optional>
#include <regex>
#include <string>

namespace cintel::audit {

// Fires at most once per document, when required_pattern matches in no chunk.
class AbsenceRule final : public RiskRule {
 public:
  // Throws RuleLibraryError when a pattern does not compile or required_pattern is empty.
  explicit AbsenceRule(RuleSpec spec);

  [[nodiscard]] std::string_view risk_type() const noexcept override { return spec_.risk_type; }
  [[nodiscard]] std::string_view version() const noexcept override { return spec_.version; }
  [[nodiscard]] domain::Severity severity() const noexcept override { return spec_.severity; }

  [[nodiscard]] std::vector<RuleHit> evaluate(
      const std::vector<domain::Chunk>& chunks) const override;

 private:
  RuleSpec spec_;
  std::optional<std::regex> anchor_;
  std::regex required_;
};

}  // namespace cintel::audit
