#include "ingest_document.h"

#include "cintel/app/app_service.h"

#include "tool_params.h"
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace cintel::server::handlers {

using json = nlohmann::json;

json handle_ingest_document(const json& params, ServerContext& ctx) {
  try {
    app::IngestDocumentRequest request;
    request.path = optional_string(params, "path");
    request.text = optional_string(params, "text");
    request.filename = optional_string(params, "filename");
    request.trace_id = optional_string(params, "trace_id");

    if (params.contains("pages") && !params["pages"].is_null()) {
      if (!params["pages"].is_array()) {
        throw std::invalid_argument("pages must be an array of strings");
      }
      std::vector<std::string> pages;
      for (const auto& page : params["pages"]) {
        if (!page.is_string()) {
          throw std::invalid_argument("pages must be an array of strings");
        }
        pages.push_back(page.get<std::string>());
      }
      request.pages = std::move(pages);
    }

    const auto response =
        app::ingest_document(request, ctx.ingestor, ctx.services, ctx.id_gen, ctx.clock);

    json warnings = json::array();
    for (const auto& warning : response.record.warnings) {
      warnings.push_back({
          {"code", warning.code},
          {"page", warning.page},
          {"original_bytes", warning.original_bytes},
          {"kept_bytes", warning.kept_bytes},
          {"message", warning.message},
      });
    }

    return json{
        {"document_id", response.record.document_id.value},
        {"page_count", response.record.pages.size()},
        {"extraction_method", response.record.extraction_method},
        {"content_hash", response.record.content_hash},
        {"warnings", warnings},
        {"trace_id", response.trace_id},
    };

  } catch (const std::exception& e) {
    return json{{"error", e.what()}};
  }
}

}  // namespace cintel::server::handlers
