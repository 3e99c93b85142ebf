#include "cintel/audit/rules/pattern_rule.h"

#include "cintel/audit/rule_library.h"

#include <charconv>

namespace cintel::audit {

namespace {

std::string replace_all(std::string text, const std::string_view token,
                        const std::string& replacement) {
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), replacement);
    pos += replacement.size();
  }
  return text;
}

bool passes(const NumericCheck check, const long value, const long threshold) {
  switch (check) {
    case NumericCheck::kNone:
      return true;
    case NumericCheck::kLessThan:
      return value < threshold;
    case NumericCheck::kGreaterThan:
      return value > threshold;
  }
  return true;
}

}  // namespace

PatternRule::PatternRule(RuleSpec spec)
    : spec_(std::move(spec)), pattern_(detail::compile_pattern(spec_.risk_type, spec_.pattern)) {
  if (spec_.pattern.empty()) {
    throw RuleLibraryError("rule " + spec_.risk_type + ": pattern rule without a pattern");
  }
  if (spec_.check != NumericCheck::kNone && pattern_.mark_count() < 1) {
    throw RuleLibraryError("rule " + spec_.risk_type +
                           ": numeric check requires a capture group in the pattern");
  }
}

std::vector<RuleHit> PatternRule::evaluate(const std::vector<domain::Chunk>& chunks) const {
  std::vector<RuleHit> hits;
  const std::string threshold = std::to_string(spec_.threshold);

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const std::string& text = chunks[i].text;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern_);
         it != std::sregex_iterator(); ++it) {
      const std::smatch& match = *it;
      if (match.length(0) == 0) {
        continue;
      }

      std::string value;
      if (spec_.check != NumericCheck::kNone && match[1].matched) {
        value = match[1].str();
        long number = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
        if (ec != std::errc{} || !passes(spec_.check, number, spec_.threshold)) {
          continue;
        }
      }

      const auto begin = static_cast<std::size_t>(match.position(0));
      hits.push_back(RuleHit{
          .chunk_index = i,
          .span = citation::Span{begin, begin + static_cast<std::size_t>(match.length(0))},
          .description = replace_all(replace_all(spec_.description, "{value}", value),
                                     "{threshold}", threshold),
      });
    }
  }
  return hits;
}

}  // namespace cintel::audit
