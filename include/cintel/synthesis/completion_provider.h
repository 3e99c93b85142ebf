#pragma once

#include "cintel/core/cancellation.h"
#include "cintel/core/result.h"

#include <functional>
#include <string>
#include <string_view>

namespace cintel::synthesis {

struct CompletionOptions {
  int max_tokens{300};       // NOLINT(readability-identifier-naming)
  double temperature{0.1};   // NOLINT(readability-identifier-naming)
};

// Receives streamed text in arrival order. Returning false stops the stream; the provider then
// reports ProviderError::kCancelled.
using FragmentSink = std::function<bool(std::string_view)>;

using CompletionResult = core::Result<std::string, core::ProviderFailure>;

// ICompletionProvider is the boundary to an external text-completion service.
// Implementations bound every call with their own timeout, and must return promptly with
// kCancelled once the token fires, releasing any open connection.
class ICompletionProvider {
 public:
  virtual ~ICompletionProvider() = default;

  [[nodiscard]] virtual CompletionResult complete(const std::string& prompt,
                                                  const CompletionOptions& options,
                                                  const core::CancellationToken& token) = 0;

  // Streams fragments into sink and returns the full text on success.
  [[nodiscard]] virtual CompletionResult complete_stream(const std::string& prompt,
                                                         const CompletionOptions& options,
                                                         const FragmentSink& sink,
                                                         const core::CancellationToken& token) = 0;

  // Short identifier recorded in traces ("ollama:llama2").
  [[nodiscard]] virtual std::string provider_id() const = 0;

 protected:
  ICompletionProvider() = default;
  ICompletionProvider(const ICompletionProvider&) = default;
  ICompletionProvider& operator=(const ICompletionProvider&) = default;
  ICompletionProvider(ICompletionProvider&&) = default;
  ICompletionProvider& operator=(ICompletionProvider&&) = default;
};

// Runs one provider call. A std::exception thrown by the call is reported as kMalformedResponse
// so it selects the extractive fallback like any other provider failure.
[[nodiscard]] CompletionResult guarded_call(const std::string& provider_id,
                                            const std::function<CompletionResult()>& call);

// NullCompletionProvider is never available. Wiring it in completion mode exercises the
// extractive fallback on every request.
class NullCompletionProvider final : public ICompletionProvider {
 public:
  [[nodiscard]] CompletionResult complete(const std::string& prompt,
                                          const CompletionOptions& options,
                                          const core::CancellationToken& token) override;
  [[nodiscard]] CompletionResult complete_stream(const std::string& prompt,
                                                 const CompletionOptions& options,
                                                 const FragmentSink& sink,
                                                 const core::CancellationToken& token) override;
  [[nodiscard]] std::string provider_id() const override { return "none"; }
};

}  // namespace cintel::synthesis
