#pragma once

#include "cintel/storage/trace_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace cintel::storage {

// Append-only store of trace events. query returns events in append order.
class ITraceLog {
 public:
  virtual ~ITraceLog() = default;

  virtual void append(const TraceEvent& event) = 0;
  [[nodiscard]] virtual std::vector<TraceEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  ITraceLog() = default;
  ITraceLog(const ITraceLog&) = default;
  ITraceLog& operator=(const ITraceLog&) = default;
  ITraceLog(ITraceLog&&) = default;
  ITraceLog& operator=(ITraceLog&&) = default;
};

class InMemoryTraceLog final : public ITraceLog {
 public:
  void append(const TraceEvent& event) override;
  [[nodiscard]] std::vector<TraceEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<TraceEvent> events_;
};

}  // namespace cintel::storage
