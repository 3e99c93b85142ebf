#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/streaming/fragment_channel.h"
#include "cintel/streaming/streaming_coordinator.h"
#include "cintel/synthesis/answer_synthesizer.h"

#include "fakes/fake_completion_provider.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace cintel;
using streaming::StreamingCoordinator;
using synthesis::AnswerSynthesizer;
using synthesis::SynthesisConfig;
using synthesis::SynthesisMode;

namespace {

const std::string kEffective = "This agreement is effective as of January 1, 2024.";
const std::string kQuestion = "What is the effective date?";

retrieval::Ranking effective_ranking() {
  const domain::Chunk chunk{.document_id = core::DocumentId{"doc-1"},
                            .page = 1,
                            .start_offset = 0,
                            .end_offset = kEffective.size(),
                            .text = kEffective};
  return retrieval::RelevanceScorer().score(kQuestion, {chunk});
}

SynthesisConfig completion_config() {
  SynthesisConfig config;
  config.mode = SynthesisMode::kCompletion;
  return config;
}

struct Drained {
  std::string text;
  std::size_t fragments{0};
  std::optional<domain::CitationsEvent> terminal;
  bool event_after_terminal{false};
};

Drained drain(streaming::AnswerStream& stream) {
  Drained out;
  while (auto event = stream.next()) {
    if (out.terminal.has_value()) {
      out.event_after_terminal = true;
    }
    if (const auto* fragment = std::get_if<domain::TextFragment>(&*event)) {
      out.text += fragment->text;
      ++out.fragments;
    } else {
      out.terminal = std::get<domain::CitationsEvent>(*event);
    }
  }
  return out;
}

}  // namespace

TEST_CASE("split_into_fragments keeps trailing whitespace", "[streaming]") {
  const auto fragments = streaming::split_into_fragments("Based on  the\ndocument.");
  CHECK(fragments == std::vector<std::string>{"Based ", "on  ", "the\n", "document."});
  CHECK(streaming::split_into_fragments("").empty());
}

TEST_CASE("Extractive stream concatenates to the synchronous answer", "[streaming]") {
  const AnswerSynthesizer synthesizer(SynthesisConfig{});
  const StreamingCoordinator coordinator(synthesizer);
  const auto expected = synthesizer.answer(kQuestion, effective_ranking());

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto drained = drain(*stream);

  CHECK(drained.text == expected.text);
  CHECK(drained.fragments > 1);
  REQUIRE(drained.terminal.has_value());
  CHECK_FALSE(drained.event_after_terminal);
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kExtractive);
  CHECK(drained.terminal->citations == expected.citations);
  CHECK_FALSE(stream->next().has_value());
}

TEST_CASE("Stream without relevant content says so and cites nothing", "[streaming]") {
  const AnswerSynthesizer synthesizer(SynthesisConfig{});
  const StreamingCoordinator coordinator(synthesizer);
  auto stream =
      coordinator.stream("What is it?", retrieval::Ranking{.has_relevance_signal = false});
  const auto drained = drain(*stream);

  CHECK(drained.text == std::string(synthesis::kNoRelevantInformation));
  REQUIRE(drained.terminal.has_value());
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kNoRelevantContent);
  CHECK(drained.terminal->citations.empty());
}

TEST_CASE("Completion stream forwards provider fragments in order", "[streaming]") {
  auto provider = testing::ScriptedCompletionProvider::returning(
      {"The agreement is effective ", "as of January 1, 2024 [C1]."});
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto drained = drain(*stream);

  CHECK(drained.fragments == 2);
  CHECK(drained.text == "The agreement is effective as of January 1, 2024 [C1].");
  REQUIRE(drained.terminal.has_value());
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kCompletion);
  REQUIRE(drained.terminal->citations.size() == 1);
  CHECK(drained.terminal->citations[0].text_snippet() == kEffective);
}

TEST_CASE("Mid-stream provider failure continues with the extractive answer", "[streaming]") {
  auto provider =
      testing::ScriptedCompletionProvider::failing(core::ProviderError::kTimeout, {"Partial "});
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);
  const auto fallback =
      synthesizer.fallback_answer(kQuestion, effective_ranking(), "provider_timeout");

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto drained = drain(*stream);

  CHECK(drained.text == "Partial \n\n" + fallback.text);
  REQUIRE(drained.terminal.has_value());
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(drained.terminal->fallback_reason == std::optional<std::string>("provider_timeout"));
  CHECK(drained.terminal->citations == fallback.citations);
}

TEST_CASE("Throwing provider still ends the stream with citations", "[streaming]") {
  testing::ThrowingCompletionProvider provider;
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);
  const auto fallback =
      synthesizer.fallback_answer(kQuestion, effective_ranking(), "provider_malformed_response");

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto drained = drain(*stream);

  CHECK(drained.text == fallback.text);
  REQUIRE(drained.terminal.has_value());
  CHECK_FALSE(drained.event_after_terminal);
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(drained.terminal->fallback_reason ==
        std::optional<std::string>("provider_malformed_response"));
  CHECK(drained.terminal->citations == fallback.citations);
  CHECK_FALSE(stream->is_cancelled());
}

TEST_CASE("Producer failure outside the provider ends with the extractive answer",
          "[streaming]") {
  testing::ThrowingCompletionProvider provider(/*identity_throws=*/true);
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);
  const auto fallback = synthesizer.fallback_answer(
      kQuestion, effective_ranking(), std::string(streaming::kStreamErrorReason));

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto drained = drain(*stream);

  CHECK(drained.text == fallback.text);
  REQUIRE(drained.terminal.has_value());
  CHECK(drained.terminal->strategy == domain::AnswerStrategy::kExtractiveFallback);
  CHECK(drained.terminal->fallback_reason == std::optional<std::string>("stream_error"));
  REQUIRE(drained.terminal->citations.size() == 1);
  CHECK(drained.terminal->citations[0].text_snippet() == kEffective);
}

TEST_CASE("Cancelling a stream releases the provider and ends the stream", "[streaming]") {
  testing::BlockingCompletionProvider provider("The agreement ");
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);

  auto stream = coordinator.stream(kQuestion, effective_ranking());
  const auto first = stream->next();
  REQUIRE(first.has_value());
  REQUIRE(std::holds_alternative<domain::TextFragment>(*first));
  CHECK(std::get<domain::TextFragment>(*first).text == "The agreement ");

  stream->cancel();
  CHECK(provider.hook_invoked());
  CHECK(stream->is_cancelled());
  CHECK_FALSE(stream->next().has_value());
}

TEST_CASE("Dropping a stream mid-answer cancels it", "[streaming]") {
  testing::BlockingCompletionProvider provider("Partial ");
  const AnswerSynthesizer synthesizer(completion_config(), &provider);
  const StreamingCoordinator coordinator(synthesizer);
  {
    auto stream = coordinator.stream(kQuestion, effective_ranking());
    REQUIRE(stream->next().has_value());
  }
  CHECK(provider.hook_invoked());
}

TEST_CASE("FragmentChannel delivers in order and stops after cancel", "[streaming]") {
  streaming::FragmentChannel<int> channel;
  CHECK(channel.push(1));
  CHECK(channel.push(2));
  CHECK(channel.pop() == std::optional<int>(1));

  channel.cancel();
  CHECK_FALSE(channel.push(3));
  CHECK_FALSE(channel.pop().has_value());

  streaming::FragmentChannel<int> closed;
  CHECK(closed.push(7));
  closed.close();
  CHECK_FALSE(closed.push(8));
  CHECK(closed.pop() == std::optional<int>(7));
  CHECK_FALSE(closed.pop().has_value());
}
