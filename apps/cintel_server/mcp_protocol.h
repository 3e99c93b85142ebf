#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cintel::server {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  // String or number, echoed back unchanged. Absent for notifications.
  std::optional<nlohmann::json> id;  // NOLINT(readability-identifier-naming)
  std::string method;                // NOLINT(readability-identifier-naming)
  nlohmann::json params;             // NOLINT(readability-identifier-naming)
};

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Parse JSON-RPC request from string; nullopt when the line is not a JSON object.
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result);

// Create JSON-RPC error response
std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message,
                                const nlohmann::json& data = nlohmann::json::object());

// Create JSON-RPC notification (no id, no response expected)
std::string make_notification(const std::string& method, const nlohmann::json& params);

}  // namespace cintel::server
