#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/synthesis/answer_synthesizer.h"

#include "cintel/synthesis/ollama_completion_provider.h"

#include "fakes/fake_completion_provider.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cintel;
using synthesis::AnswerSynthesizer;
using synthesis::SynthesisConfig;
using synthesis::SynthesisMode;

namespace {

const std::string kEffective = "This agreement is effective as of January 1, 2024.";

domain::Chunk make_chunk(const std::string& text, int page = 1, std::size_t start = 0) {
  return domain::Chunk{.document_id = core::DocumentId{"doc-1"},
                       .page = page,
                       .start_offset = start,
                       .end_offset = start + text.size(),
                       .text = text};
}

retrieval::Ranking rank(const std::string& question, const std::vector<domain::Chunk>& chunks) {
  return retrieval::RelevanceScorer().score(question, chunks);
}

SynthesisConfig completion_config() {
  SynthesisConfig config;
  config.mode = SynthesisMode::kCompletion;
  return config;
}

}  // namespace

TEST_CASE("Extractive answer normalizes the effective date and cites its sentence",
          "[synthesis]") {
  const AnswerSynthesizer synthesizer(SynthesisConfig{});
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));

  CHECK(answer.strategy == domain::AnswerStrategy::kExtractive);
  CHECK(answer.text.find("2024-01-01") != std::string::npos);
  CHECK(answer.text.find("January 1, 2024") != std::string::npos);
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].page() == 1);
  CHECK(answer.citations[0].char_range() == domain::CharRange{0, kEffective.size()});
  CHECK(answer.citations[0].text_snippet() == kEffective);
  CHECK_FALSE(answer.fallback_reason.has_value());
}

TEST_CASE("Extractive answer quotes the amount for price questions", "[synthesis]") {
  const AnswerSynthesizer synthesizer(SynthesisConfig{});
  const std::string question = "What is the monthly fee?";
  const auto answer = synthesizer.answer(
      question, rank(question, {make_chunk("The monthly fee is $1,500.00 payable in advance.")}));
  CHECK(answer.text.find("1500.00 USD") != std::string::npos);
  REQUIRE(answer.citations.size() == 1);
}

TEST_CASE("Extractive answer quotes the best matching sentence", "[synthesis]") {
  const std::string text =
      "This Agreement starts today. Either party may give termination notice in writing. "
      "Payment is monthly.";
  const AnswerSynthesizer synthesizer(SynthesisConfig{});
  const std::string question = "How is termination notice given?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(text, 3, 200)}));

  CHECK(answer.text ==
        "Based on the document: \"Either party may give termination notice in writing.\"");
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].page() == 3);
  CHECK(answer.citations[0].char_range() == domain::CharRange{229, 281});
}

TEST_CASE("No relevant content yields the no-information answer", "[synthesis]") {
  const AnswerSynthesizer synthesizer(SynthesisConfig{});

  SECTION("question without content terms") {
    const auto answer =
        synthesizer.answer("What is it?", rank("What is it?", {make_chunk(kEffective)}));
    CHECK(answer.strategy == domain::AnswerStrategy::kNoRelevantContent);
    CHECK(answer.text == std::string(synthesis::kNoRelevantInformation));
    CHECK(answer.citations.empty());
  }

  SECTION("no chunk above the relevance floor") {
    const std::string question = "indemnification cap";
    const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));
    CHECK(answer.strategy == domain::AnswerStrategy::kNoRelevantContent);
    CHECK(answer.citations.empty());
  }
}

TEST_CASE("Completion mode requires a provider", "[synthesis]") {
  CHECK_THROWS_AS(AnswerSynthesizer(completion_config(), nullptr), std::invalid_argument);
}

TEST_CASE("Attributed completion keeps the provider text", "[synthesis]") {
  auto provider = testing::ScriptedCompletionProvider::returning(
      {"The agreement is effective as of January 1, 2024 [C1]."});
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));

  CHECK(answer.strategy == domain::AnswerStrategy::kCompletion);
  CHECK(answer.text == "The agreement is effective as of January 1, 2024 [C1].");
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].text_snippet() == kEffective);
  CHECK(provider.calls == 1);
  CHECK(provider.last_prompt.find("[C1] (document doc-1, page 1)") != std::string::npos);
  CHECK(provider.last_prompt.find(kEffective) != std::string::npos);
}

TEST_CASE("Provider failure falls back to the extractive answer", "[synthesis]") {
  auto provider = testing::ScriptedCompletionProvider::failing(core::ProviderError::kTimeout);
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));

  CHECK(answer.strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(answer.fallback_reason == std::optional<std::string>("provider_timeout"));
  CHECK(answer.text.find("2024-01-01") != std::string::npos);
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].text_snippet() == kEffective);
}

TEST_CASE("Provider exceptions fall back to the extractive answer", "[synthesis]") {
  testing::ThrowingCompletionProvider provider;
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));

  CHECK(answer.strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(answer.fallback_reason == std::optional<std::string>("provider_malformed_response"));
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].text_snippet() == kEffective);
}

TEST_CASE("Non-UTF-8 chunk text reaches the Ollama provider without throwing", "[synthesis]") {
  synthesis::OllamaConfig config;
  config.base_url = "http://127.0.0.1:1";
  config.connect_timeout_ms = 500;
  config.timeout_ms = 2000;
  synthesis::OllamaCompletionProvider provider(config);
  const AnswerSynthesizer synthesizer(completion_config(), &provider);

  const std::string page = "Payment is due within 30 days under \xA7 4 of this agreement.";
  const std::string question = "When is payment due?";
  domain::Answer answer;
  REQUIRE_NOTHROW(answer = synthesizer.answer(question, rank(question, {make_chunk(page)})));

  CHECK(answer.strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(answer.fallback_reason == std::optional<std::string>("provider_unavailable"));
  REQUIRE(answer.citations.size() == 1);
  CHECK(answer.citations[0].text_snippet() == page);
}

TEST_CASE("Unattributable completion falls back to the extractive answer", "[synthesis]") {
  auto provider =
      testing::ScriptedCompletionProvider::returning({"Bananas are a yellow fruit."});
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));

  CHECK(answer.strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(answer.fallback_reason == std::optional<std::string>("unattributed_completion"));
  CHECK(answer.text.find("Bananas") == std::string::npos);
}

TEST_CASE("Provider is not called without relevant content", "[synthesis]") {
  auto provider = testing::ScriptedCompletionProvider::returning({"anything"});
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const auto answer =
      synthesizer.answer("What is it?", rank("What is it?", {make_chunk(kEffective)}));
  CHECK(answer.strategy == domain::AnswerStrategy::kNoRelevantContent);
  CHECK(provider.calls == 0);
}

TEST_CASE("Null provider always selects the fallback", "[synthesis]") {
  synthesis::NullCompletionProvider provider;
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const std::string question = "What is the effective date?";
  const auto answer = synthesizer.answer(question, rank(question, {make_chunk(kEffective)}));
  CHECK(answer.strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(answer.fallback_reason == std::optional<std::string>("provider_unavailable"));
}
