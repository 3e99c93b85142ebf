#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cintel::server {

enum class LlmBackend {
  kNone,    // NOLINT(readability-identifier-naming) extractive synthesis only
  kOllama,  // NOLINT(readability-identifier-naming)
};

// ServerConfig holds all parsed startup flags for the server.
// Every field has an explicit default; optional fields mean "not configured".
struct ServerConfig {
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  LlmBackend llm{LlmBackend::kNone};     // NOLINT(readability-identifier-naming)
  std::string ollama_url{"http://localhost:11434"};  // NOLINT(readability-identifier-naming)
  std::string ollama_model{"llama2"};                // NOLINT(readability-identifier-naming)
  long llm_timeout_ms{120000};                       // NOLINT(readability-identifier-naming)
  long top_k{3};                                     // NOLINT(readability-identifier-naming)
  long chunk_size{500};                              // NOLINT(readability-identifier-naming)
  double chunk_overlap{0.2};                         // NOLINT(readability-identifier-naming)
  long min_renewal_notice_days{30};                  // NOLINT(readability-identifier-naming)
  long max_confidentiality_years{5};                 // NOLINT(readability-identifier-naming)
  bool show_help{false};                             // NOLINT(readability-identifier-naming)
  bool show_version{false};                          // NOLINT(readability-identifier-naming)
  // One message per flag whose value could not be parsed; reported by the startup guard.
  std::vector<std::string> invalid_flags;  // NOLINT(readability-identifier-naming)
};

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Flag table for --help.
[[nodiscard]] std::string usage_text();

}  // namespace cintel::server
