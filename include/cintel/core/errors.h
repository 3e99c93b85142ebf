#pragma once

#include <stdexcept>
#include <string>

namespace cintel::core {

// InputError reports a caller mistake (unknown document_id, empty question).
// Surfaced immediately and never retried.
class InputError : public std::invalid_argument {
 public:
  explicit InputError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace cintel::core
