#include "tool_params.h"

#include <stdexcept>
#include <vector>

namespace cintel::server::handlers {

std::string require_string(const nlohmann::json& params, const std::string& key) {
  if (!params.contains(key) || !params[key].is_string() ||
      params[key].get_ref<const std::string&>().empty()) {
    throw std::invalid_argument(key + " (string) is required");
  }
  return params[key].get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& params, const std::string& key) {
  if (!params.contains(key) || params[key].is_null()) {
    return std::nullopt;
  }
  if (!params[key].is_string()) {
    throw std::invalid_argument(key + " must be a string");
  }
  return params[key].get<std::string>();
}

core::DocumentId require_document_id(const nlohmann::json& params) {
  return core::DocumentId{require_string(params, "document_id")};
}

app::AnswerRequest read_answer_request(const nlohmann::json& params) {
  if (!params.contains("question") || !params["question"].is_string()) {
    throw std::invalid_argument("question (string) is required");
  }

  app::AnswerRequest request;
  request.question = params["question"].get<std::string>();
  request.trace_id = optional_string(params, "trace_id");

  if (params.contains("document_ids") && !params["document_ids"].is_null()) {
    const auto& ids = params["document_ids"];
    if (!ids.is_array()) {
      throw std::invalid_argument("document_ids must be an array of strings");
    }
    std::vector<core::DocumentId> document_ids;
    for (const auto& id : ids) {
      if (!id.is_string()) {
        throw std::invalid_argument("document_ids must be an array of strings");
      }
      document_ids.push_back(core::DocumentId{id.get<std::string>()});
    }
    request.document_ids = std::move(document_ids);
  }
  return request;
}

}  // namespace cintel::server::handlers
