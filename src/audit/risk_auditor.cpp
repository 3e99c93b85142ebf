#include "cintel/audit/risk_auditor.h"

#include <algorithm>
#include <tuple>

namespace cintel::audit {

namespace {

std::size_t evidence_length(const domain::Finding& f) {
  const auto [start, end] = f.evidence.char_range();
  return end - start;
}

bool same_location(const domain::Finding& a, const domain::Finding& b) {
  return a.risk_type == b.risk_type && a.evidence.document_id() == b.evidence.document_id() &&
         a.evidence.page() == b.evidence.page();
}

// Keeps the widest finding of each run of same-type findings with overlapping evidence.
std::vector<domain::Finding> collapse_overlaps(std::vector<domain::Finding> findings) {
  std::sort(findings.begin(), findings.end(),
            [](const domain::Finding& a, const domain::Finding& b) {
              const auto a_page = a.evidence.page();
              const auto b_page = b.evidence.page();
              const auto a_doc = a.evidence.document_id();
              const auto b_doc = b.evidence.document_id();
              const auto a_start = a.evidence.char_range().first;
              const auto b_start = b.evidence.char_range().first;
              const auto a_len = evidence_length(a);
              const auto b_len = evidence_length(b);
              return std::tie(a.risk_type, a_doc, a_page, a_start, b_len) <
                     std::tie(b.risk_type, b_doc, b_page, b_start, a_len);
            });

  std::vector<domain::Finding> kept;
  std::size_t i = 0;
  while (i < findings.size()) {
    std::size_t best = i;
    std::size_t run_end = findings[i].evidence.char_range().second;
    std::size_t j = i + 1;
    while (j < findings.size() && same_location(findings[j], findings[i]) &&
           findings[j].evidence.char_range().first < run_end) {
      run_end = std::max(run_end, findings[j].evidence.char_range().second);
      if (evidence_length(findings[j]) > evidence_length(findings[best])) {
        best = j;
      }
      ++j;
    }
    kept.push_back(std::move(findings[best]));
    i = j;
  }
  return kept;
}

}  // namespace

RiskAuditor::RiskAuditor(RuleLibrary library) : library_(std::move(library)) {}

std::vector<domain::Finding> RiskAuditor::audit(const std::vector<domain::Chunk>& chunks) const {
  std::vector<domain::Finding> findings;

  for (const auto& rule : library_.rules) {
    for (const RuleHit& hit : rule->evaluate(chunks)) {
      findings.push_back(domain::Finding{
          .risk_type = std::string(rule->risk_type()),
          .severity = rule->severity(),
          .description = hit.description,
          .evidence = resolver_.resolve(chunks[hit.chunk_index], hit.span),
          .rule_version = std::string(rule->version()),
      });
    }
  }

  findings = collapse_overlaps(std::move(findings));

  std::sort(findings.begin(), findings.end(),
            [](const domain::Finding& a, const domain::Finding& b) {
              if (a.severity != b.severity) {
                return a.severity > b.severity;
              }
              const auto [a_start, a_end] = a.evidence.char_range();
              const auto [b_start, b_end] = b.evidence.char_range();
              const int a_page = a.evidence.page();
              const int b_page = b.evidence.page();
              return std::tie(a_page, a_start, a.risk_type, a_end, a.evidence.document_id()) <
                     std::tie(b_page, b_start, b.risk_type, b_end, b.evidence.document_id());
            });
  return findings;
}

}  // namespace cintel::audit
