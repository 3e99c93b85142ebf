#include "cintel/storage/trace_log.h"

#include <set>

namespace cintel::storage {

void InMemoryTraceLog::append(const TraceEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<TraceEvent> InMemoryTraceLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TraceEvent> out;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      out.push_back(event);
    }
  }
  return out;
}

std::vector<std::string> InMemoryTraceLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> ids;
  for (const auto& event : events_) {
    ids.insert(event.trace_id);
  }
  return {ids.begin(), ids.end()};
}

}  // namespace cintel::storage
