#pragma once

#include "cintel/domain/citation.h"

#include <map>
#include <optional>
#include <string>

namespace cintel::domain {

// A key contract term located in the document, with the sentence it came from.
struct ExtractedField {
  std::string value;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> normalized;  // NOLINT(readability-identifier-naming)
  Citation citation;                      // NOLINT(readability-identifier-naming)
};

// Keyed by field name ("effective_date", "governing_law", ...).
using ExtractedFields = std::map<std::string, ExtractedField>;

}  // namespace cintel::domain
