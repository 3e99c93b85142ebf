#include "get_trace.h"

#include "cintel/app/app_service.h"

#include "tool_params.h"
#include <exception>
#include <string>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_get_trace(const json& params, ServerContext& ctx) {
  try {
    const std::string trace_id = require_string(params, "trace_id");
    const auto events = app::fetch_trace(trace_id, ctx.services);

    json result;
    result["trace_id"] = trace_id;
    result["events"] = json::array();

    for (const auto& event : events) {
      result["events"].push_back({
          {"event_id", event.event_id},
          {"trace_id", event.trace_id},
          {"event_type", event.event_type},
          {"payload", json::parse(event.payload)},
          {"created_at", event.created_at},
          {"refs", event.refs},
      });
    }

    return result;

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
