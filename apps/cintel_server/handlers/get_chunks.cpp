#include "get_chunks.h"

#include "cintel/app/app_service.h"
#include "cintel/domain/serialization.h"

#include "tool_params.h"
#include <exception>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_get_chunks(const json& params, ServerContext& ctx) {
  try {
    const auto document_id = require_document_id(params);
    const auto chunks = app::get_chunks(document_id, ctx.services);

    return json{
        {"document_id", document_id.value},
        {"chunker", ctx.services.chunker.signature()},
        {"count", chunks->size()},
        {"chunks", domain::chunks_to_json(*chunks)},
    };

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
