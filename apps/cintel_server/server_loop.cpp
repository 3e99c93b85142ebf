#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace cintel::server {

using json = nlohmann::json;

namespace {

bool is_notification(const JsonRpcRequest& request) {
  return !request.id.has_value() && request.method.rfind("notifications/", 0) == 0;
}

}  // namespace

void run_server_loop(std::istream& in, ServerContext& ctx) {
  // Method registry
  auto method_registry = build_method_registry();

  // Main loop: read JSON-RPC requests from in, write responses to ctx.out
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line == "\r") {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      ctx.out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n"
              << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    if (is_notification(request)) {
      continue;
    }
    if (request.method.empty()) {
      ctx.out << make_error_response(request.id, kInvalidRequest, "Missing method") << "\n"
              << std::flush;
      continue;
    }
    std::cerr << "Received: " << request.method << "\n";

    // Dispatch via method registry
    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      ctx.out << make_error_response(request.id, kMethodNotFound,
                                     "Unknown method: " + request.method)
              << "\n"
              << std::flush;
      continue;
    }

    try {
      json result = it->second(request, ctx);
      ctx.out << make_response(request.id, result) << "\n" << std::flush;
    } catch (const std::exception& e) {
      std::cerr << "Error: " << request.method << " failed: " << e.what() << "\n";
      ctx.out << make_error_response(request.id, kInternalError, e.what()) << "\n" << std::flush;
    }
  }

  std::cerr << "contract-intel server shutting down\n";
}

}  // namespace cintel::server
