#include "method_handlers.h"

#include "cintel/core/version.h"

#include "handlers/tool_registry.h"

namespace cintel::server {

using json = nlohmann::json;

namespace {

json string_property(const std::string& description) {
  return {{"type", "string"}, {"description", description}};
}

json document_id_schema() {
  return {
      {"type", "object"},
      {"properties", {{"document_id", string_property("ID returned by ingest_document")}}},
      {"required", json::array({"document_id"})},
  };
}

json question_schema() {
  return {
      {"type", "object"},
      {"properties",
       {
           {"question", string_property("Natural-language question about the contract")},
           {"document_ids",
            {{"type", "array"},
             {"items", {{"type", "string"}}},
             {"description", "Documents to search (default: all)"}}},
           {"trace_id", {{"type", "string"}}},
       }},
      {"required", json::array({"question"})},
  };
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "contract-intel"}, {"version", core::kBuildVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", "ingest_document"},
      {"description", "Ingest a contract from a file path, inline text or pre-split pages"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"path", string_property("Path to a .txt, .docx or .pdf file")},
                {"text", string_property("Plain text; form feeds separate pages")},
                {"pages",
                 {{"type", "array"},
                  {"items", {{"type", "string"}}},
                  {"description", "Page texts from an external PDF-to-text service"}}},
                {"filename", {{"type", "string"}}},
                {"trace_id", {{"type", "string"}}},
            }},
       }},
  });

  tools.push_back({
      {"name", "ask"},
      {"description", "Answer a question with citations into the ingested documents"},
      {"inputSchema", question_schema()},
  });

  tools.push_back({
      {"name", "ask_stream"},
      {"description",
       "Answer a question incrementally; text arrives as notifications/answer_fragment"},
      {"inputSchema", question_schema()},
  });

  tools.push_back({
      {"name", "audit"},
      {"description", "Run the risk rule library over a document"},
      {"inputSchema", document_id_schema()},
  });

  tools.push_back({
      {"name", "extract_fields"},
      {"description", "Extract key contract terms with citations"},
      {"inputSchema", document_id_schema()},
  });

  tools.push_back({
      {"name", "get_chunks"},
      {"description", "List the chunks a document is split into"},
      {"inputSchema", document_id_schema()},
  });

  tools.push_back({
      {"name", "get_trace"},
      {"description", "Fetch trace events by trace_id"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"trace_id", {{"type", "string"}}}}},
           {"required", json::array({"trace_id"})},
       }},
  });

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  std::string tool_name = req.params.value("name", "");
  json tool_params = req.params.value("arguments", json::object());

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    json error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace cintel::server
