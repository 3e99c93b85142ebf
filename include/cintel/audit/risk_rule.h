#pragma once

#include "cintel/citation/sentence_segmenter.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/finding.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::audit {

// A rule firing: the chunk it fired in and the matched span inside that chunk.
struct RuleHit {
  std::size_t chunk_index{0};  // NOLINT(readability-identifier-naming)
  citation::Span span;         // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming) with placeholders filled
};

// RiskRule is the abstract base of compiled rules. Evaluation is a pure function of the
// chunk text: no randomness, no I/O.
class RiskRule {
 public:
  virtual ~RiskRule() = default;

  [[nodiscard]] virtual std::string_view risk_type() const noexcept = 0;
  [[nodiscard]] virtual std::string_view version() const noexcept = 0;
  [[nodiscard]] virtual domain::Severity severity() const noexcept = 0;

  // chunks are one document's chunk set in document order.
  [[nodiscard]] virtual std::vector<RuleHit> evaluate(
      const std::vector<domain::Chunk>& chunks) const = 0;

 protected:
  RiskRule() = default;
  RiskRule(const RiskRule&) = default;
  RiskRule& operator=(const RiskRule&) = default;
  RiskRule(RiskRule&&) = default;
  RiskRule& operator=(RiskRule&&) = default;
};

}  // namespace cintel::audit
