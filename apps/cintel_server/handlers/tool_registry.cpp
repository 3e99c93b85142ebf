#include "tool_registry.h"

#include "ask.h"
#include "audit.h"
#include "extract_fields.h"
#include "get_chunks.h"
#include "get_trace.h"
#include "ingest_document.h"

namespace cintel::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"ingest_document", handle_ingest_document},
      {"ask", handle_ask},
      {"ask_stream", handle_ask_stream},
      {"audit", handle_audit},
      {"extract_fields", handle_extract_fields},
      {"get_chunks", handle_get_chunks},
      {"get_trace", handle_get_trace},
  };
}

}  // namespace cintel::server::handlers
