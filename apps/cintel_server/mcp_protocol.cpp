#include "mcp_protocol.h"

namespace cintel::server {

namespace {

nlohmann::json id_or_null(const std::optional<nlohmann::json>& id) {
  return id.has_value() ? id.value() : nlohmann::json(nullptr);
}

// Invalid UTF-8 in a frame becomes U+FFFD on the wire.
std::string serialize(const nlohmann::json& frame) {
  return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  auto json = nlohmann::json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  request.jsonrpc = json.value("jsonrpc", "2.0");

  if (json.contains("id") && (json["id"].is_string() || json["id"].is_number())) {
    request.id = json["id"];
  }

  if (json.contains("method") && json["method"].is_string()) {
    request.method = json["method"].get<std::string>();
  }
  if (json.contains("params") && json["params"].is_object()) {
    request.params = json["params"];
  } else {
    request.params = nlohmann::json::object();
  }

  return request;
}

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["result"] = result;
  return serialize(response);
}

std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_or_null(id);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return serialize(response);
}

std::string make_notification(const std::string& method, const nlohmann::json& params) {
  nlohmann::json notification;
  notification["jsonrpc"] = "2.0";
  notification["method"] = method;
  notification["params"] = params;
  return serialize(notification);
}

}  // namespace cintel::server
