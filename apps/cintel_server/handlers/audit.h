#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace cintel::server::handlers {

nlohmann::json handle_audit(const nlohmann::json& params, ServerContext& ctx);

}  // namespace cintel::server::handlers
