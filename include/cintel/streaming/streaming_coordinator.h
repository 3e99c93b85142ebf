#pragma once

#include "cintel/core/cancellation.h"
#include "cintel/domain/stream_event.h"
#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/streaming/fragment_channel.h"
#include "cintel/synthesis/answer_synthesizer.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cintel::streaming {

// fallback_reason of a stream whose producer failed outside the completion provider.
inline constexpr std::string_view kStreamErrorReason = "stream_error";

// AnswerStream is a finite, non-restartable sequence of answer events: zero or more
// TextFragment values followed by exactly one CitationsEvent, unless cancelled.
//
// One producer thread fills the stream; next() blocks until the following event is ready.
class AnswerStream {
 public:
  ~AnswerStream();

  AnswerStream(const AnswerStream&) = delete;
  AnswerStream& operator=(const AnswerStream&) = delete;
  AnswerStream(AnswerStream&&) = delete;
  AnswerStream& operator=(AnswerStream&&) = delete;

  // nullopt after the CitationsEvent, or once cancelled.
  [[nodiscard]] std::optional<domain::StreamEvent> next();

  // Stops the stream. Cancellation hooks (including the provider's connection release) run
  // before this returns. No further events are delivered, the citations event included.
  void cancel();

  [[nodiscard]] bool is_cancelled() const { return cancellation_.is_cancelled(); }

 private:
  friend class StreamingCoordinator;
  AnswerStream() = default;

  FragmentChannel<domain::StreamEvent> channel_;
  core::CancellationSource cancellation_;
  std::thread producer_;
};

// StreamingCoordinator runs answer synthesis incrementally.
//
// Completion mode forwards provider fragments as they arrive and resolves citations once the
// full text is known. If the provider fails or its text cannot be attributed, the stream
// carries the extractive answer instead (after a blank line when some text was already sent)
// and the final event carries the extractive citations. Any other failure while producing
// still ends the stream with the extractive answer, tagged kStreamErrorReason. Extractive mode cuts the finished
// answer into word fragments so both modes stream the same way.
class StreamingCoordinator {
 public:
  // synthesizer must outlive every stream this coordinator creates.
  explicit StreamingCoordinator(const synthesis::AnswerSynthesizer& synthesizer)
      : synthesizer_(synthesizer) {}

  [[nodiscard]] std::unique_ptr<AnswerStream> stream(std::string question,
                                                     retrieval::Ranking ranking) const;

  // Stream of an answer decided without synthesis: its text as fragments, then its citations.
  [[nodiscard]] static std::unique_ptr<AnswerStream> replay(const domain::Answer& answer);

 private:
  const synthesis::AnswerSynthesizer& synthesizer_;
};

// Word-sized pieces of text, each keeping its trailing whitespace. Concatenating them gives
// back text.
[[nodiscard]] std::vector<std::string> split_into_fragments(std::string_view text);

}  // namespace cintel::streaming
