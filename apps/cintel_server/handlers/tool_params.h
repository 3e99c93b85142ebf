#pragma once

#include <nlohmann/json.hpp>

#include "cintel/app/app_service.h"
#include "cintel/core/ids.h"

#include <optional>
#include <string>

namespace cintel::server::handlers {

// Throws std::invalid_argument when params[key] is missing or not a non-empty string.
[[nodiscard]] std::string require_string(const nlohmann::json& params, const std::string& key);

// nullopt when absent; throws std::invalid_argument when present but not a string.
[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& params,
                                                         const std::string& key);

[[nodiscard]] core::DocumentId require_document_id(const nlohmann::json& params);

// question (required), document_ids (optional string array), trace_id (optional).
[[nodiscard]] app::AnswerRequest read_answer_request(const nlohmann::json& params);

}  // namespace cintel::server::handlers
