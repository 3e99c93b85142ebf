#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace cintel::server::handlers {

nlohmann::json handle_extract_fields(const nlohmann::json& params, ServerContext& ctx);

}  // namespace cintel::server::handlers
