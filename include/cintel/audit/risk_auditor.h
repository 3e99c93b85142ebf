#pragma once

#include "cintel/audit/rule_library.h"
#include "cintel/citation/citation_resolver.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/finding.h"

#include <string>
#include <vector>

namespace cintel::audit {

// RiskAuditor runs the rule library over one document's chunks.
//
// Evidence for every hit goes through the sentence-widening CitationResolver. Hits of the
// same risk type whose evidence overlaps on a page (the same clause seen through two
// overlapping chunks) collapse to the widest one; distinct clauses each keep their finding.
//
// Order: severity descending, then page, start offset, risk_type, end offset, document_id.
// Output is byte-identical for identical chunk text and library version.
class RiskAuditor {
 public:
  explicit RiskAuditor(RuleLibrary library);

  [[nodiscard]] std::vector<domain::Finding> audit(const std::vector<domain::Chunk>& chunks) const;

  [[nodiscard]] const std::string& library_version() const noexcept { return library_.version; }
  [[nodiscard]] const RuleLibrary& library() const noexcept { return library_; }

 private:
  RuleLibrary library_;
  citation::CitationResolver resolver_{citation::BoundaryPolicy::kSentence};
};

}  // namespace cintel::audit
