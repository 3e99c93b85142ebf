#pragma once

#include <string>
#include <vector>

namespace cintel::storage {

// One step of a request's provenance trail. payload is a JSON object string.
struct TraceEvent {
  std::string event_id;           // NOLINT(readability-identifier-naming)
  std::string trace_id;           // NOLINT(readability-identifier-naming)
  std::string event_type;         // NOLINT(readability-identifier-naming)
  std::string payload;            // NOLINT(readability-identifier-naming)
  std::string created_at;         // NOLINT(readability-identifier-naming)
  std::vector<std::string> refs;  // NOLINT(readability-identifier-naming) document IDs involved
};

}  // namespace cintel::storage
