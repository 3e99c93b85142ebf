#include "cintel/domain/finding.h"

#include "cintel/domain/answer.h"

namespace cintel::domain {

const char* to_string(const Severity severity) {
  switch (severity) {
    case Severity::kLow:
      return "low";
    case Severity::kMedium:
      return "medium";
    case Severity::kHigh:
      return "high";
  }
  return "low";
}

std::optional<Severity> parse_severity(const std::string_view text) {
  if (text == "low") {
    return Severity::kLow;
  }
  if (text == "medium") {
    return Severity::kMedium;
  }
  if (text == "high") {
    return Severity::kHigh;
  }
  return std::nullopt;
}

const char* to_string(const AnswerStrategy strategy) {
  switch (strategy) {
    case AnswerStrategy::kExtractive:
      return "extractive";
    case AnswerStrategy::kCompletion:
      return "completion";
    case AnswerStrategy::kExtractiveFallback:
      return "extractive_fallback";
    case AnswerStrategy::kNoRelevantContent:
      return "no_relevant_content";
  }
  return "extractive";
}

}  // namespace cintel::domain
