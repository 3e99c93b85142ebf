#include "cintel/extraction/field_extractor.h"

#include "cintel/core/normalization.h"
#include "cintel/extraction/value_parsers.h"

#include <optional>
#include <stdexcept>
#include <utility>

namespace cintel::extraction {

namespace {

struct ReadValue {
  std::string value;
  std::optional<std::string> normalized;
};

// Index of the first capture group that took part in the match, or 0.
std::size_t first_group(const std::cmatch& m) {
  for (std::size_t i = 1; i < m.size(); ++i) {
    if (m[i].matched && m[i].length() > 0) {
      return i;
    }
  }
  return 0;
}

std::optional<std::string> days_of(const std::string& value) {
  static const std::regex kNumber(R"((\d+))");
  std::smatch m;
  if (!std::regex_search(value, m, kNumber)) {
    return std::nullopt;
  }
  return m.str(1) + " days";
}

}  // namespace

std::vector<FieldSpec> default_field_specs() {
  return {
      {.name = "effective_date",
       .pattern = R"(\b(?:effective(?:\s+date)?(?:\s+(?:as\s+of|on|from))?|dated(?:\s+as\s+of)?|)"
                  R"(executed\s+(?:on|as\s+of))\b[\s:]*(?:the\s+)?([^;\n]{6,40}))",
       .case_sensitive = false,
       .kind = ValueKind::kDate},
      {.name = "term",
       .pattern = R"(\b(?:initial\s+term|term\s+of\s+this\s+(?:agreement|contract)|duration)\b)"
                  R"([^.]{0,60}?\b((?:\d+|one|two|three|four|five|six|seven|eight|nine|ten|)"
                  R"(twelve|eighteen|twenty-four|thirty-six)(?:\s*\(\d+\))?[\s-]+(?:years?|months?)))",
       .case_sensitive = false,
       .kind = ValueKind::kGroup},
      {.name = "governing_law",
       .pattern = R"([Gg]overned\s+by\s+(?:and\s+construed\s+in\s+accordance\s+with\s+)?)"
                  R"((?:the\s+)?[Ll]aws?\s+of\s+(?:the\s+)?)"
                  R"(((?:State|Commonwealth|Province)\s+of\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+)?|)"
                  R"([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?))",
       .case_sensitive = true,
       .kind = ValueKind::kGroup},
      {.name = "payment_terms",
       .pattern = R"(\b(?:payments?|invoices?|fees?)\b[^.]{0,80}?\b(net\s+\d+|within\s+\w+)"
                  R"((?:\s*\(\d+\))?\s+(?:business\s+|calendar\s+)?days))",
       .case_sensitive = false,
       .kind = ValueKind::kDays},
      {.name = "termination_notice",
       .pattern = R"(\bterminat\w*\b[^.]{0,80}?\b(\w+(?:\s*\(\d+\))?\s+(?:business\s+|calendar\s+)?)"
                  R"(days?'?\s+(?:prior\s+)?(?:written\s+)?notice))",
       .case_sensitive = false,
       .kind = ValueKind::kDays},
      {.name = "auto_renewal",
       .pattern = R"(\b(auto(?:matic(?:ally)?)?[-\s]?renew\w*|renew\w*\s+automatically)\b)",
       .case_sensitive = false,
       .kind = ValueKind::kSentence},
      {.name = "confidentiality",
       .pattern = R"(\b(confidential\s+information|confidentiality|non[-\s]?disclosure)\b)",
       .case_sensitive = false,
       .kind = ValueKind::kSentence},
      {.name = "liability_cap",
       .pattern = R"(\b(?:liability\s+(?:cap|limit)|maximum\s+(?:aggregate\s+)?liability|)"
                  R"(liability[^.]{0,80}?(?:shall\s+not\s+exceed|exceed|limited\s+to))[^.$\d]{0,40}?)"
                  R"(((?:\$|USD\s*|EUR\s*|GBP\s*)\d[\d,]*(?:\.\d{2})?|\d[\d,]*(?:\.\d{2})?\s*(?:USD|EUR|GBP)))",
       .case_sensitive = false,
       .kind = ValueKind::kAmount},
      {.name = "parties",
       .pattern = R"(\b(?:[Bb]etween|BETWEEN)\s+([A-Z][A-Za-z0-9&.,' -]*?[A-Za-z.])\s*)"
                  R"((?:\([^)]*\)\s*)?,?\s+and\s+([A-Z][A-Za-z0-9&.,' -]*?[A-Za-z])\.?)"
                  R"((?=\s*(?:\(|,|;|\n|\.\s|\.?$)))",
       .case_sensitive = true,
       .kind = ValueKind::kParties},
  };
}

FieldExtractor::FieldExtractor(const std::vector<FieldSpec>& specs) {
  fields_.reserve(specs.size());
  for (const auto& spec : specs) {
    constexpr auto kBase = std::regex::ECMAScript | std::regex::optimize;
    const auto flags = spec.case_sensitive ? kBase : kBase | std::regex::icase;
    try {
      fields_.push_back(CompiledField{spec, std::regex(spec.pattern, flags)});
    } catch (const std::regex_error& e) {
      throw std::runtime_error("field '" + spec.name + "': invalid pattern: " + e.what());
    }
  }
}

domain::ExtractedFields FieldExtractor::extract(const domain::ChunkList& chunks) const {
  domain::ExtractedFields out;
  for (const auto& field : fields_) {
    for (const auto& chunk : chunks) {
      if (try_extract(field, chunk, out)) {
        break;
      }
    }
  }
  return out;
}

bool FieldExtractor::try_extract(const CompiledField& field, const domain::Chunk& chunk,
                                 domain::ExtractedFields& out) const {
  const char* const first = chunk.text.data();
  const char* const last = first + chunk.text.size();

  for (std::cregex_iterator it(first, last, field.re), end; it != end; ++it) {
    const std::cmatch& m = *it;
    const std::size_t group = first_group(m);
    if (m.length(0) == 0 || group == 0) {
      continue;
    }
    const auto match_begin = static_cast<std::size_t>(m.position(0));
    const auto match_end = match_begin + static_cast<std::size_t>(m.length(0));
    const auto group_begin = static_cast<std::size_t>(m.position(group));

    std::optional<ReadValue> read;
    switch (field.spec.kind) {
      case ValueKind::kGroup:
        read = ReadValue{core::trim(m.str(group)), std::nullopt};
        break;
      case ValueKind::kDays: {
        std::string value = core::trim(m.str(group));
        auto normalized = days_of(value);
        read = ReadValue{std::move(value), std::move(normalized)};
        break;
      }
      case ValueKind::kDate:
        if (auto date = find_date(std::string_view(chunk.text).substr(
                group_begin, static_cast<std::size_t>(m.length(group))))) {
          read = ReadValue{date->text, date->normalized};
        }
        break;
      case ValueKind::kAmount:
        if (auto amount = find_amount(std::string_view(chunk.text).substr(
                group_begin, static_cast<std::size_t>(m.length(group))))) {
          read = ReadValue{amount->text, amount->normalized};
        }
        break;
      case ValueKind::kSentence:
        read = ReadValue{};
        break;
      case ValueKind::kParties:
        if (m[1].matched && m[2].matched) {
          read = ReadValue{core::trim(m.str(1)) + " and " + core::trim(m.str(2)), std::nullopt};
        }
        break;
    }
    if (!read.has_value()) {
      continue;
    }

    domain::Citation evidence = resolver_.resolve(chunk, citation::Span{match_begin, match_end});
    if (field.spec.kind == ValueKind::kSentence) {
      read->value = evidence.text_snippet();
    }
    out.emplace(field.spec.name, domain::ExtractedField{.value = std::move(read->value),
                                                        .normalized = std::move(read->normalized),
                                                        .citation = std::move(evidence)});
    return true;
  }
  return false;
}

}  // namespace cintel::extraction
