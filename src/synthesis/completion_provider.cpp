#include "cintel/synthesis/completion_provider.h"

#include <exception>

namespace cintel::synthesis {

CompletionResult guarded_call(const std::string& provider_id,
                              const std::function<CompletionResult()>& call) {
  try {
    return call();
  } catch (const std::exception& e) {
    return CompletionResult::err({core::ProviderError::kMalformedResponse,
                                  provider_id + " threw: " + e.what()});
  }
}

CompletionResult NullCompletionProvider::complete(const std::string& /*prompt*/,
                                                  const CompletionOptions& /*options*/,
                                                  const core::CancellationToken& /*token*/) {
  return CompletionResult::err(
      {core::ProviderError::kUnavailable, "no completion provider configured"});
}

CompletionResult NullCompletionProvider::complete_stream(const std::string& /*prompt*/,
                                                         const CompletionOptions& /*options*/,
                                                         const FragmentSink& /*sink*/,
                                                         const core::CancellationToken& /*token*/) {
  return CompletionResult::err(
      {core::ProviderError::kUnavailable, "no completion provider configured"});
}

}  // namespace cintel::synthesis
