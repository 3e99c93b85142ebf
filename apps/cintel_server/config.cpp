#include "config.h"

#include "../shared/arg_parser.h"

#include <charconv>
#include <cstdlib>
#include <string>
#include <vector>

namespace cintel::server {

namespace {

using Option = apps::Option<ServerConfig>;

// ────────────────────────────────────────────────────────────────
// Value Parsing
// ────────────────────────────────────────────────────────────────

bool parse_long(ServerConfig& config, const std::string& flag, const std::string& value,
                long& out) {
  long parsed = 0;
  const char* const first = value.data();
  const char* const last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    config.invalid_flags.push_back("Invalid " + flag + ": '" + value + "' (expected an integer)");
    return false;
  }
  out = parsed;
  return true;
}

bool parse_double(ServerConfig& config, const std::string& flag, const std::string& value,
                  double& out) {
  char* end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (value.empty() || end != value.c_str() + value.size()) {
    config.invalid_flags.push_back("Invalid " + flag + ": '" + value + "' (expected a number)");
    return false;
  }
  out = parsed;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_db(ServerConfig& config, const std::string& value) {
  config.db_path = value;
  return true;
}

bool handle_redis(ServerConfig& config, const std::string& value) {
  config.redis_uri = value;
  return true;
}

bool handle_llm(ServerConfig& config, const std::string& value) {
  if (value == "none") {
    config.llm = LlmBackend::kNone;
    return true;
  }
  if (value == "ollama") {
    config.llm = LlmBackend::kOllama;
    return true;
  }
  config.invalid_flags.push_back("Invalid --llm: '" + value + "' (valid: none, ollama)");
  return false;
}

bool handle_ollama_url(ServerConfig& config, const std::string& value) {
  config.ollama_url = value;
  return true;
}

bool handle_ollama_model(ServerConfig& config, const std::string& value) {
  config.ollama_model = value;
  return true;
}

bool handle_llm_timeout(ServerConfig& config, const std::string& value) {
  return parse_long(config, "--llm-timeout-ms", value, config.llm_timeout_ms);
}

bool handle_top_k(ServerConfig& config, const std::string& value) {
  return parse_long(config, "--top-k", value, config.top_k);
}

bool handle_chunk_size(ServerConfig& config, const std::string& value) {
  return parse_long(config, "--chunk-size", value, config.chunk_size);
}

bool handle_chunk_overlap(ServerConfig& config, const std::string& value) {
  return parse_double(config, "--chunk-overlap", value, config.chunk_overlap);
}

bool handle_min_renewal_notice(ServerConfig& config, const std::string& value) {
  return parse_long(config, "--min-renewal-notice-days", value, config.min_renewal_notice_days);
}

bool handle_max_confidentiality(ServerConfig& config, const std::string& value) {
  return parse_long(config, "--max-confidentiality-years", value,
                    config.max_confidentiality_years);
}

bool handle_help(ServerConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

bool handle_version(ServerConfig& config, const std::string& /*value*/) {
  config.show_version = true;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<Option> build_option_registry() {
  return {
      {"--db", true, "SQLite file for documents and traces (default: in-memory)", handle_db},
      {"--redis", true, "Redis URI for the shared chunk cache (default: in-memory)",
       handle_redis},
      {"--llm", true, "Completion backend (none|ollama, default: none)", handle_llm},
      {"--ollama-url", true, "Ollama base URL (default: http://localhost:11434)",
       handle_ollama_url},
      {"--ollama-model", true, "Ollama model name (default: llama2)", handle_ollama_model},
      {"--llm-timeout-ms", true, "Completion timeout in milliseconds (default: 120000)",
       handle_llm_timeout},
      {"--top-k", true, "Chunks returned by the relevance scorer (default: 3)", handle_top_k},
      {"--chunk-size", true, "Chunk target size in bytes, 50 to 4096 (default: 500)",
       handle_chunk_size},
      {"--chunk-overlap", true, "Chunk overlap fraction in [0, 0.5] (default: 0.2)",
       handle_chunk_overlap},
      {"--min-renewal-notice-days", true, "Auto-renewal notice threshold (default: 30)",
       handle_min_renewal_notice},
      {"--max-confidentiality-years", true, "Confidentiality survival threshold (default: 5)",
       handle_max_confidentiality},
      {"--help", false, "Show this help and exit", handle_help},
      {"--version", false, "Show the version and exit", handle_version},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

ServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options<ServerConfig>(
      argc, argv, build_option_registry(),
      [](ServerConfig& config, const std::string& message) {
        config.invalid_flags.push_back(message);
      });
}

std::string usage_text() {
  return "Usage: cintel_server [options]\n\n"
         "Contract question answering and risk audit over JSON-RPC on stdio.\n\n"
         "Options:\n" +
         apps::format_options(build_option_registry());
}

}  // namespace cintel::server
