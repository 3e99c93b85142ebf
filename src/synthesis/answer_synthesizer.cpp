#include "cintel/synthesis/answer_synthesizer.h"

#include "cintel/citation/sentence_segmenter.h"
#include "cintel/core/normalization.h"
#include "cintel/extraction/value_parsers.h"
#include "cintel/synthesis/attribution.h"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace cintel::synthesis {

namespace {

enum class QuestionIntent { kGeneral, kDate, kAmount };

QuestionIntent classify_question(const std::string_view question) {
  const auto tokens = core::tokenize_ascii(question);
  const auto has = [&tokens](std::initializer_list<std::string_view> words) {
    return std::any_of(tokens.begin(), tokens.end(), [&words](const std::string& t) {
      return std::find(words.begin(), words.end(), t) != words.end();
    });
  };
  if (has({"when", "date", "dated"})) {
    return QuestionIntent::kDate;
  }
  if (has({"amount", "price", "fee", "fees", "cost", "much"})) {
    return QuestionIntent::kAmount;
  }
  return QuestionIntent::kGeneral;
}

// Best sentence of text for the given terms: most distinct terms matched, then complete over
// partial, then earliest. nullopt when no sentence matches any term.
std::optional<citation::Span> best_sentence(const domain::Chunk& chunk,
                                            const std::vector<std::string>& terms) {
  const auto sentences = citation::segment_sentences(chunk.text);
  std::optional<citation::Span> best;
  std::size_t best_hits = 0;
  bool best_complete = false;
  for (std::size_t i = 0; i < sentences.size(); ++i) {
    const auto& sentence = sentences[i];
    const auto sentence_terms =
        core::content_terms(std::string_view(chunk.text).substr(sentence.span.begin,
                                                                sentence.span.size()));
    std::size_t hits = 0;
    for (const auto& term : terms) {
      if (std::binary_search(sentence_terms.begin(), sentence_terms.end(), term)) {
        ++hits;
      }
    }
    if (hits == 0) {
      continue;
    }
    const bool opens_mid_sentence = i == 0 && chunk.start_offset != 0;
    const bool complete = !opens_mid_sentence && sentence.terminated;
    if (hits > best_hits || (hits == best_hits && complete && !best_complete)) {
      best = sentence.span;
      best_hits = hits;
      best_complete = complete;
    }
  }
  return best;
}

std::string quoted(const domain::Citation& evidence) {
  return "\"" + evidence.text_snippet() + "\"";
}

}  // namespace

const char* to_string(const SynthesisMode mode) {
  switch (mode) {
    case SynthesisMode::kExtractive:
      return "extractive";
    case SynthesisMode::kCompletion:
      return "completion";
  }
  return "unknown";
}

AnswerSynthesizer::AnswerSynthesizer(SynthesisConfig config, ICompletionProvider* provider)
    : config_(config), provider_(provider) {
  if (config_.mode == SynthesisMode::kCompletion && provider_ == nullptr) {
    throw std::invalid_argument("completion synthesis requires a completion provider");
  }
}

bool AnswerSynthesizer::has_relevant_content(const retrieval::Ranking& ranking) {
  return ranking.has_relevance_signal && !ranking.results.empty();
}

domain::Answer AnswerSynthesizer::no_information_answer() {
  return domain::Answer{.text = std::string(kNoRelevantInformation),
                        .citations = {},
                        .strategy = domain::AnswerStrategy::kNoRelevantContent,
                        .fallback_reason = std::nullopt};
}

domain::Answer AnswerSynthesizer::answer(const std::string_view question,
                                         const retrieval::Ranking& ranking,
                                         const core::CancellationToken& token) const {
  if (!has_relevant_content(ranking)) {
    return no_information_answer();
  }
  if (config_.mode == SynthesisMode::kExtractive) {
    return extractive_answer(question, ranking);
  }

  const Prompt prompt = build_prompt(question, ranking);
  const auto completion = guarded_call(provider_->provider_id(), [&] {
    return provider_->complete(prompt.text, config_.completion, token);
  });
  if (!completion.has_value()) {
    const auto& failure = completion.error();
    std::cerr << "WARNING: completion provider " << provider_->provider_id() << " failed ("
              << core::to_string(failure.code) << "): " << failure.message
              << "; using extractive answer\n";
    return fallback_answer(question, ranking,
                           std::string("provider_") + core::to_string(failure.code));
  }

  auto citations = attribute_completion(completion.value(), ranking, prompt.chunks_included);
  if (citations.empty()) {
    std::cerr << "WARNING: completion could not be attributed to any excerpt; using extractive "
                 "answer\n";
    return fallback_answer(question, ranking, "unattributed_completion");
  }
  return domain::Answer{.text = core::trim(completion.value()),
                        .citations = std::move(citations),
                        .strategy = domain::AnswerStrategy::kCompletion,
                        .fallback_reason = std::nullopt};
}

domain::Answer AnswerSynthesizer::extractive_answer(const std::string_view question,
                                                    const retrieval::Ranking& ranking) const {
  if (!has_relevant_content(ranking)) {
    return no_information_answer();
  }
  const domain::Chunk& top = ranking.results.front().chunk;

  const auto cite_value = [&](const std::optional<extraction::ValueMatch>& match,
                              const std::string& label) -> std::optional<domain::Answer> {
    if (!match.has_value()) {
      return std::nullopt;
    }
    auto evidence = resolver_.resolve(top, citation::Span{match->begin, match->end});
    std::string text = "Based on the document, the " + label + " is " + match->text + " (" +
                       match->normalized + "): " + quoted(evidence);
    return domain::Answer{.text = std::move(text),
                          .citations = {std::move(evidence)},
                          .strategy = domain::AnswerStrategy::kExtractive,
                          .fallback_reason = std::nullopt};
  };

  switch (classify_question(question)) {
    case QuestionIntent::kDate:
      if (auto dated = cite_value(extraction::find_date(top.text), "relevant date")) {
        return std::move(*dated);
      }
      break;
    case QuestionIntent::kAmount:
      if (auto priced = cite_value(extraction::find_amount(top.text), "amount")) {
        return std::move(*priced);
      }
      break;
    case QuestionIntent::kGeneral:
      break;
  }

  std::vector<std::string> terms = ranking.query_terms;
  terms.insert(terms.end(), ranking.expansion_terms.begin(), ranking.expansion_terms.end());
  const auto sentence = best_sentence(top, terms);
  auto evidence =
      sentence.has_value() ? resolver_.resolve(top, *sentence) : resolver_.resolve(top);
  std::string text = "Based on the document: " + quoted(evidence);
  return domain::Answer{.text = std::move(text),
                        .citations = {std::move(evidence)},
                        .strategy = domain::AnswerStrategy::kExtractive,
                        .fallback_reason = std::nullopt};
}

domain::Answer AnswerSynthesizer::fallback_answer(const std::string_view question,
                                                  const retrieval::Ranking& ranking,
                                                  std::string reason) const {
  domain::Answer result = extractive_answer(question, ranking);
  if (result.strategy == domain::AnswerStrategy::kExtractive) {
    result.strategy = domain::AnswerStrategy::kExtractiveFallback;
    result.fallback_reason = std::move(reason);
  }
  return result;
}

Prompt AnswerSynthesizer::build_prompt(const std::string_view question,
                                       const retrieval::Ranking& ranking) const {
  return synthesis::build_prompt(question, ranking.results, config_.max_context_chars);
}

std::vector<domain::Citation> AnswerSynthesizer::attribute_completion(
    const std::string_view completion_text, const retrieval::Ranking& ranking,
    const std::size_t chunks_prompted) const {
  std::vector<domain::Citation> citations;
  for (const std::size_t index : attribute(completion_text, ranking.results, chunks_prompted)) {
    citations.push_back(resolver_.resolve(ranking.results[index].chunk));
  }
  return citations;
}

}  // namespace cintel::synthesis
