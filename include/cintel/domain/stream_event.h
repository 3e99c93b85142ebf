#pragma once

#include "cintel/domain/answer.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cintel::domain {

// A piece of answer text, in emission order.
struct TextFragment {
  std::string text;  // NOLINT(readability-identifier-naming)
};

// Terminal event of an answer stream. Emitted exactly once, after every fragment,
// and never after cancellation.
struct CitationsEvent {
  std::vector<Citation> citations;                       // NOLINT(readability-identifier-naming)
  AnswerStrategy strategy{AnswerStrategy::kExtractive};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> fallback_reason;            // NOLINT(readability-identifier-naming)
};

using StreamEvent = std::variant<TextFragment, CitationsEvent>;

}  // namespace cintel::domain
