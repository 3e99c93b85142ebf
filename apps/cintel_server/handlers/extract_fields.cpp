#include "extract_fields.h"

#include "cintel/app/app_service.h"
#include "cintel/domain/serialization.h"

#include "tool_params.h"
#include <exception>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_extract_fields(const json& params, ServerContext& ctx) {
  try {
    const auto document_id = require_document_id(params);
    const auto response = app::extract_fields(document_id, ctx.services, ctx.id_gen, ctx.clock);

    return json{
        {"document_id", response.document_id.value},
        {"fields", domain::extracted_fields_to_json(response.fields)},
        {"trace_id", response.trace_id},
    };

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
