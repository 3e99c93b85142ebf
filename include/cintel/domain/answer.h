#pragma once

#include "cintel/domain/citation.h"

#include <optional>
#include <string>
#include <vector>

namespace cintel::domain {

// How an answer was produced.
enum class AnswerStrategy {
  kExtractive,          // configured extractive mode
  kCompletion,          // provider text attributed to supplied chunks
  kExtractiveFallback,  // provider failed or its text was unsupported
  kNoRelevantContent,   // nothing above the relevance floor
};

[[nodiscard]] const char* to_string(AnswerStrategy strategy);

// Citations are ordered by descending relevance, ties by (page, start_offset).
struct Answer {
  std::string text;                              // NOLINT(readability-identifier-naming)
  std::vector<Citation> citations;               // NOLINT(readability-identifier-naming)
  AnswerStrategy strategy{AnswerStrategy::kExtractive};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> fallback_reason;    // NOLINT(readability-identifier-naming)
};

}  // namespace cintel::domain
