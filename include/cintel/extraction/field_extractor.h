#pragma once

#include "cintel/citation/citation_resolver.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/extracted_field.h"

#include <regex>
#include <string>
#include <vector>

namespace cintel::extraction {

// How the value of a field is read off a pattern match.
enum class ValueKind {
  kGroup,     // first participating capture group, trimmed
  kDate,      // a date inside the first group; normalized to ISO-8601
  kAmount,    // a money amount inside the first group; normalized "<amount> <currency>"
  kDays,      // first group; normalized "<n> days" when it contains a number
  kSentence,  // the cited sentence itself
  kParties,   // groups 1 and 2 joined with " and "
};

struct FieldSpec {
  std::string name;              // NOLINT(readability-identifier-naming)
  std::string pattern;           // NOLINT(readability-identifier-naming) ECMAScript
  bool case_sensitive{false};    // NOLINT(readability-identifier-naming)
  ValueKind kind{ValueKind::kGroup};  // NOLINT(readability-identifier-naming)
};

// effective_date, term, governing_law, payment_terms, termination_notice, auto_renewal,
// confidentiality, liability_cap, parties.
[[nodiscard]] std::vector<FieldSpec> default_field_specs();

// FieldExtractor locates key contract terms. For each field the first usable match in document
// order wins; fields without one are absent from the result. Every field carries the citation
// of the sentence it was read from.
class FieldExtractor {
 public:
  // Throws std::runtime_error naming the field when a pattern does not compile.
  explicit FieldExtractor(const std::vector<FieldSpec>& specs = default_field_specs());

  // chunks in document order: page, then start_offset.
  [[nodiscard]] domain::ExtractedFields extract(const domain::ChunkList& chunks) const;

  [[nodiscard]] std::size_t field_count() const noexcept { return fields_.size(); }

 private:
  struct CompiledField {
    FieldSpec spec;
    std::regex re;
  };

  [[nodiscard]] bool try_extract(const CompiledField& field, const domain::Chunk& chunk,
                                 domain::ExtractedFields& out) const;

  std::vector<CompiledField> fields_;
  citation::CitationResolver resolver_{citation::BoundaryPolicy::kSentence};
};

}  // namespace cintel::extraction
