#include "cintel/streaming/streaming_coordinator.h"

#include "cintel/core/normalization.h"

#include <exception>
#include <iostream>
#include <utility>

namespace cintel::streaming {

namespace {

using Channel = FragmentChannel<domain::StreamEvent>;

bool push_text(Channel& channel, std::string_view text) {
  for (auto& piece : split_into_fragments(text)) {
    if (!channel.push(domain::TextFragment{.text = std::move(piece)})) {
      return false;
    }
  }
  return true;
}

void finish(Channel& channel, const domain::Answer& answer) {
  channel.push(domain::CitationsEvent{.citations = answer.citations,
                                      .strategy = answer.strategy,
                                      .fallback_reason = answer.fallback_reason});
}

void produce(const synthesis::AnswerSynthesizer& synthesizer, const std::string& question,
             const retrieval::Ranking& ranking, Channel& channel,
             const core::CancellationToken& token) {
  if (!synthesis::AnswerSynthesizer::has_relevant_content(ranking) ||
      synthesizer.mode() == synthesis::SynthesisMode::kExtractive) {
    const domain::Answer answer = synthesizer.answer(question, ranking, token);
    if (push_text(channel, answer.text)) {
      finish(channel, answer);
    }
    return;
  }

  synthesis::ICompletionProvider& provider = *synthesizer.provider();
  const synthesis::Prompt prompt = synthesizer.build_prompt(question, ranking);
  bool sent_text = false;
  const synthesis::FragmentSink sink = [&channel, &sent_text](std::string_view fragment) {
    sent_text = true;
    return channel.push(domain::TextFragment{.text = std::string(fragment)});
  };
  const auto completion = synthesis::guarded_call(provider.provider_id(), [&] {
    return provider.complete_stream(prompt.text, synthesizer.config().completion, sink, token);
  });
  if (token.is_cancelled() || channel.is_cancelled()) {
    return;
  }

  std::string reason;
  if (completion.has_value()) {
    auto citations =
        synthesizer.attribute_completion(completion.value(), ranking, prompt.chunks_included);
    if (!citations.empty()) {
      channel.push(domain::CitationsEvent{.citations = std::move(citations),
                                          .strategy = domain::AnswerStrategy::kCompletion,
                                          .fallback_reason = std::nullopt});
      return;
    }
    std::cerr << "WARNING: streamed completion could not be attributed to any excerpt; "
                 "appending extractive answer\n";
    reason = "unattributed_completion";
  } else {
    const auto& failure = completion.error();
    std::cerr << "WARNING: completion stream from " << provider.provider_id() << " failed ("
              << core::to_string(failure.code) << "): " << failure.message
              << "; using extractive answer\n";
    reason = std::string("provider_") + core::to_string(failure.code);
  }

  const domain::Answer fallback = synthesizer.fallback_answer(question, ranking, std::move(reason));
  if (sent_text && !channel.push(domain::TextFragment{.text = "\n\n"})) {
    return;
  }
  if (push_text(channel, fallback.text)) {
    finish(channel, fallback);
  }
}

// Ends a stream whose producer threw. A consumer that did not cancel still gets exactly one
// terminal event: the extractive answer, or the no-information answer if that fails too.
void finish_after_error(const synthesis::AnswerSynthesizer& synthesizer,
                        const std::string& question, const retrieval::Ranking& ranking,
                        Channel& channel, const core::CancellationToken& token) {
  if (token.is_cancelled() || channel.is_cancelled()) {
    return;
  }
  domain::Answer answer;
  try {
    answer = synthesizer.fallback_answer(question, ranking, std::string(kStreamErrorReason));
  } catch (const std::exception& e) {
    std::cerr << "Error: extractive answer failed: " << e.what() << "\n";
    answer = synthesis::AnswerSynthesizer::no_information_answer();
    answer.fallback_reason = std::string(kStreamErrorReason);
  }
  if (push_text(channel, answer.text)) {
    finish(channel, answer);
  }
}

}  // namespace

std::vector<std::string> split_into_fragments(const std::string_view text) {
  std::vector<std::string> fragments;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t end = pos;
    while (end < text.size() && !core::is_ascii_space(text[end])) {
      ++end;
    }
    while (end < text.size() && core::is_ascii_space(text[end])) {
      ++end;
    }
    fragments.emplace_back(text.substr(pos, end - pos));
    pos = end;
  }
  return fragments;
}

AnswerStream::~AnswerStream() {
  cancel();
  if (producer_.joinable()) {
    producer_.join();
  }
}

std::optional<domain::StreamEvent> AnswerStream::next() {
  return channel_.pop();
}

void AnswerStream::cancel() {
  channel_.cancel();
  cancellation_.cancel();
}

std::unique_ptr<AnswerStream> StreamingCoordinator::stream(std::string question,
                                                           retrieval::Ranking ranking) const {
  std::unique_ptr<AnswerStream> answer_stream(new AnswerStream());
  AnswerStream* target = answer_stream.get();
  target->producer_ = std::thread([&synthesizer = synthesizer_, target,
                                   question = std::move(question), ranking = std::move(ranking),
                                   token = target->cancellation_.token()] {
    try {
      produce(synthesizer, question, ranking, target->channel_, token);
    } catch (const std::exception& e) {
      std::cerr << "Error: answer stream failed: " << e.what() << "\n";
      finish_after_error(synthesizer, question, ranking, target->channel_, token);
    }
    target->channel_.close();
  });
  return answer_stream;
}

std::unique_ptr<AnswerStream> StreamingCoordinator::replay(const domain::Answer& answer) {
  std::unique_ptr<AnswerStream> answer_stream(new AnswerStream());
  if (push_text(answer_stream->channel_, answer.text)) {
    finish(answer_stream->channel_, answer);
  }
  answer_stream->channel_.close();
  return answer_stream;
}

}  // namespace cintel::streaming
