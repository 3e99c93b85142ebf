#include "cintel/synthesis/prompt_builder.h"

#include "cintel/core/utf8.h"

#include <sstream>

namespace cintel::synthesis {

namespace {

constexpr std::string_view kInstructions =
    "You are a contract analysis assistant. Answer the question using only the contract "
    "excerpts below. Quote the contract wording where possible. If the excerpts do not "
    "contain the answer, say that the documents do not say.";

}  // namespace

Prompt build_prompt(const std::string_view question,
                    const std::vector<retrieval::ScoredChunk>& chunks,
                    const std::size_t max_context_chars) {
  std::ostringstream out;
  out << kInstructions << "\n\n";

  Prompt prompt;
  std::size_t used = 0;
  for (const auto& scored : chunks) {
    const std::string& text = scored.chunk.text;
    std::string_view excerpt = text;
    if (used + excerpt.size() > max_context_chars) {
      if (prompt.chunks_included > 0) {
        break;
      }
      excerpt = excerpt.substr(0, core::utf8_floor(text, max_context_chars));
    }
    ++prompt.chunks_included;
    used += excerpt.size();
    out << "[C" << prompt.chunks_included << "] (document " << scored.chunk.document_id.value
        << ", page " << scored.chunk.page << ")\n"
        << excerpt << "\n\n";
  }

  out << "Question: " << question << "\n\nAnswer:";
  prompt.text = out.str();
  return prompt;
}

}  // namespace cintel::synthesis
