#include "cintel/audit/rules/absence_rule.h"

#include "cintel/audit/rule_library.h"

#include <algorithm>
#include <map>
#include <utility>

namespace cintel::audit {

namespace {

// Page text covered by the chunk set; overlapping windows counted once.
std::size_t covered_bytes(const std::vector<domain::Chunk>& chunks) {
  std::map<std::pair<std::string, int>, std::size_t> page_ends;
  for (const auto& chunk : chunks) {
    auto& end = page_ends[{chunk.document_id.value, chunk.page}];
    end = std::max(end, chunk.end_offset);
  }
  std::size_t total = 0;
  for (const auto& [page, end] : page_ends) {
    total += end;
  }
  return total;
}

}  // namespace

AbsenceRule::AbsenceRule(RuleSpec spec)
    : spec_(std::move(spec)),
      required_(detail::compile_pattern(spec_.risk_type, spec_.required_pattern)) {
  if (spec_.required_pattern.empty()) {
    throw RuleLibraryError("rule " + spec_.risk_type + ": absence rule without required_pattern");
  }
  if (!spec_.pattern.empty()) {
    anchor_ = detail::compile_pattern(spec_.risk_type, spec_.pattern);
  }
}

std::vector<RuleHit> AbsenceRule::evaluate(const std::vector<domain::Chunk>& chunks) const {
  if (chunks.empty() || covered_bytes(chunks) < spec_.min_document_bytes) {
    return {};
  }
  for (const auto& chunk : chunks) {
    if (std::regex_search(chunk.text, required_)) {
      return {};
    }
  }

  if (!anchor_.has_value()) {
    const auto sentences = citation::split_sentences(chunks.front().text);
    const citation::Span opening =
        sentences.empty() ? citation::Span{0, chunks.front().text.size()} : sentences.front();
    return {RuleHit{.chunk_index = 0, .span = opening, .description = spec_.description}};
  }

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    std::smatch match;
    if (std::regex_search(chunks[i].text, match, *anchor_) && match.length(0) > 0) {
      const auto begin = static_cast<std::size_t>(match.position(0));
      return {RuleHit{
          .chunk_index = i,
          .span = citation::Span{begin, begin + static_cast<std::size_t>(match.length(0))},
          .description = spec_.description,
      }};
    }
  }
  return {};
}

}  // namespace cintel::audit
