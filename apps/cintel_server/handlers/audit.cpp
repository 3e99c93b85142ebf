#include "audit.h"

#include "cintel/app/app_service.h"
#include "cintel/domain/serialization.h"

#include "tool_params.h"
#include <exception>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_audit(const json& params, ServerContext& ctx) {
  try {
    const auto document_id = require_document_id(params);
    const auto response = app::get_audit(document_id, ctx.services, ctx.id_gen, ctx.clock);

    return json{
        {"document_id", response.document_id.value},
        {"findings", domain::findings_to_json(response.findings)},
        {"count", response.findings.size()},
        {"rule_library_version", response.rule_library_version},
        {"trace_id", response.trace_id},
    };

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
