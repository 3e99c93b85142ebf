#pragma once

#include "cintel/citation/citation_resolver.h"
#include "cintel/core/cancellation.h"
#include "cintel/domain/answer.h"
#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/synthesis/completion_provider.h"
#include "cintel/synthesis/prompt_builder.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::synthesis {

enum class SynthesisMode {
  kExtractive,
  kCompletion,
};

[[nodiscard]] const char* to_string(SynthesisMode mode);

inline constexpr std::string_view kNoRelevantInformation =
    "I couldn't find relevant information to answer this question in the provided documents.";

struct SynthesisConfig {
  SynthesisMode mode{SynthesisMode::kExtractive};  // NOLINT(readability-identifier-naming)
  CompletionOptions completion;                    // NOLINT(readability-identifier-naming)
  std::size_t max_context_chars{3000};             // NOLINT(readability-identifier-naming)
};

// AnswerSynthesizer turns a ranking into an Answer.
//
// Strategy is fixed at construction:
// - kExtractive quotes the best sentence of the top-ranked chunk. No external calls.
// - kCompletion prompts the provider with the top-ranked chunks and keeps only the citations of
//   chunks the returned text can be attributed to. Provider failures and unattributable text
//   fall back to the extractive answer with strategy kExtractiveFallback.
//
// Citations always come from the CitationResolver over supplied chunks, never from provider
// output. With no relevance signal, or no ranked chunks, the answer says so and cites nothing.
class AnswerSynthesizer {
 public:
  // provider is not owned and must outlive the synthesizer. Throws std::invalid_argument in
  // completion mode without a provider.
  explicit AnswerSynthesizer(SynthesisConfig config, ICompletionProvider* provider = nullptr);

  [[nodiscard]] domain::Answer answer(std::string_view question, const retrieval::Ranking& ranking,
                                      const core::CancellationToken& token = {}) const;

  [[nodiscard]] domain::Answer extractive_answer(std::string_view question,
                                                 const retrieval::Ranking& ranking) const;

  // The extractive answer relabelled as a fallback for reason.
  [[nodiscard]] domain::Answer fallback_answer(std::string_view question,
                                               const retrieval::Ranking& ranking,
                                               std::string reason) const;

  [[nodiscard]] static domain::Answer no_information_answer();

  // False when nothing ranked above the relevance floor.
  [[nodiscard]] static bool has_relevant_content(const retrieval::Ranking& ranking);

  [[nodiscard]] Prompt build_prompt(std::string_view question,
                                    const retrieval::Ranking& ranking) const;

  // Citations, in rank order, of the prompted chunks that support completion_text. Empty when
  // the text cannot be attributed to any of them.
  [[nodiscard]] std::vector<domain::Citation> attribute_completion(
      std::string_view completion_text, const retrieval::Ranking& ranking,
      std::size_t chunks_prompted) const;

  [[nodiscard]] const SynthesisConfig& config() const noexcept { return config_; }
  [[nodiscard]] SynthesisMode mode() const noexcept { return config_.mode; }
  [[nodiscard]] ICompletionProvider* provider() const noexcept { return provider_; }

 private:
  SynthesisConfig config_;
  ICompletionProvider* provider_;
  citation::CitationResolver resolver_{citation::BoundaryPolicy::kSentence};
};

}  // namespace cintel::synthesis
