#pragma once

#include <string>

namespace cintel::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).

struct DocumentId {
  std::string value;
  auto operator<=>(const DocumentId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

}  // namespace cintel::core
