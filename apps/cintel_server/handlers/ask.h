#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace cintel::server::handlers {

nlohmann::json handle_ask(const nlohmann::json& params, ServerContext& ctx);

// Writes one notifications/answer_fragment frame per text fragment to ctx.out, then returns
// the citations with "done": true.
nlohmann::json handle_ask_stream(const nlohmann::json& params, ServerContext& ctx);

}  // namespace cintel::server::handlers
