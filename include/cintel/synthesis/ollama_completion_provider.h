#pragma once

#include "cintel/synthesis/completion_provider.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cintel::synthesis {

struct OllamaConfig {
  std::string base_url{"http://localhost:11434"};  // NOLINT(readability-identifier-naming)
  std::string model{"llama2"};                     // NOLINT(readability-identifier-naming)
  long timeout_ms{120000};                         // NOLINT(readability-identifier-naming)
  long connect_timeout_ms{5000};                   // NOLINT(readability-identifier-naming)
  int context_window{2048};                        // NOLINT(readability-identifier-naming)
};

// Body of POST /api/generate.
[[nodiscard]] nlohmann::json build_generate_request(const OllamaConfig& config,
                                                    const std::string& prompt,
                                                    const CompletionOptions& options,
                                                    bool stream);

// Parses a non-streamed /api/generate body. An "error" member maps to kUnavailable; a body that
// is not JSON, or lacks a non-empty "response" string, maps to kMalformedResponse.
[[nodiscard]] CompletionResult parse_generate_response(std::string_view body);

// Splits a byte stream into newline-terminated lines as it arrives. Carriage returns before
// the newline are dropped and empty lines are skipped.
class NdjsonLineBuffer {
 public:
  [[nodiscard]] std::vector<std::string> feed(std::string_view bytes);

  // Bytes received after the last newline.
  [[nodiscard]] const std::string& pending() const noexcept { return pending_; }

 private:
  std::string pending_;
};

// OllamaCompletionProvider talks to a local or remote Ollama server with libcurl.
// One easy handle per call; the handle is released before the call returns, including on
// timeout and cancellation.
class OllamaCompletionProvider final : public ICompletionProvider {
 public:
  explicit OllamaCompletionProvider(OllamaConfig config);

  [[nodiscard]] CompletionResult complete(const std::string& prompt,
                                          const CompletionOptions& options,
                                          const core::CancellationToken& token) override;
  [[nodiscard]] CompletionResult complete_stream(const std::string& prompt,
                                                 const CompletionOptions& options,
                                                 const FragmentSink& sink,
                                                 const core::CancellationToken& token) override;
  [[nodiscard]] std::string provider_id() const override;

  [[nodiscard]] const OllamaConfig& config() const noexcept { return config_; }

 private:
  OllamaConfig config_;
};

}  // namespace cintel::synthesis
