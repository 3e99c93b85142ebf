#include "ask.h"

#include "cintel/app/app_service.h"
#include "cintel/domain/serialization.h"

#include "../mcp_protocol.h"
#include "tool_params.h"
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_ask(const json& params, ServerContext& ctx) {
  try {
    const auto request = read_answer_request(params);
    const auto response = app::get_answer(request, ctx.services, ctx.id_gen, ctx.clock);

    json result = domain::answer_to_json(response.answer);
    result["trace_id"] = response.trace_id;
    return result;

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

json handle_ask_stream(const json& params, ServerContext& ctx) {
  try {
    const auto request = read_answer_request(params);
    auto response = app::get_answer_stream(request, ctx.services, ctx.id_gen, ctx.clock);

    std::optional<domain::CitationsEvent> terminal;
    while (auto event = response.stream->next()) {
      std::visit(
          [&](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, domain::TextFragment>) {
              ctx.out << make_notification("notifications/answer_fragment",
                                           {{"trace_id", response.trace_id},
                                            {"token", ev.text},
                                            {"done", false}})
                      << "\n"
                      << std::flush;
            } else {
              terminal = ev;
            }
          },
          *event);
    }
    app::record_stream_outcome(response.trace_id, terminal, ctx.services, ctx.id_gen, ctx.clock);

    if (!terminal.has_value()) {
      return json{{"trace_id", response.trace_id}, {"error", "stream cancelled"}, {"done", true}};
    }

    json citations = json::array();
    for (const auto& citation : terminal->citations) {
      citations.push_back(domain::citation_to_json(citation));
    }
    json result{{"trace_id", response.trace_id},
                {"citations", std::move(citations)},
                {"strategy", domain::to_string(terminal->strategy)},
                {"done", true}};
    if (terminal->fallback_reason.has_value()) {
      result["fallback_reason"] = *terminal->fallback_reason;
    }
    return result;

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
