#include "cintel/citation/sentence_segmenter.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace cintel::citation;

namespace {

std::vector<std::string> sentence_texts(std::string_view text) {
  std::vector<std::string> out;
  for (const auto& span : split_sentences(text)) {
    out.emplace_back(text.substr(span.begin, span.size()));
  }
  return out;
}

}  // namespace

TEST_CASE("Sentences end at terminal punctuation followed by whitespace", "[citation]") {
  const auto sentences = sentence_texts(
      "The term is one year. Either party may terminate! Is notice required? Yes.");
  REQUIRE(sentences.size() == 4);
  CHECK(sentences[0] == "The term is one year.");
  CHECK(sentences[1] == "Either party may terminate!");
  CHECK(sentences[2] == "Is notice required?");
  CHECK(sentences[3] == "Yes.");
}

TEST_CASE("Abbreviations and initials do not end a sentence", "[citation]") {
  const auto sentences =
      sentence_texts("Acme Inc. shall pay U.S. taxes, e.g. sales tax. Payment is due.");
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0] == "Acme Inc. shall pay U.S. taxes, e.g. sales tax.");

  CHECK(sentence_texts("Signed by J. Smith on behalf of Acme.").size() == 1);
}

TEST_CASE("Decimal numbers do not end a sentence", "[citation]") {
  const auto sentences = sentence_texts("The fee is 1.5 percent. It is due monthly.");
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0] == "The fee is 1.5 percent.");
}

TEST_CASE("Closing quotes stay with their sentence", "[citation]") {
  const auto sentences = sentence_texts("The notice read \"terminated.\" Then it was filed.");
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0] == "The notice read \"terminated.\"");
}

TEST_CASE("A blank line ends a sentence", "[citation]") {
  const auto sentences = segment_sentences("Section 1 Definitions\n\nThe term means one year.");
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0].span == Span{0, 21});
  CHECK(sentences[0].terminated);
  CHECK(sentences[1].terminated);
}

TEST_CASE("Trailing text without punctuation is an unterminated sentence", "[citation]") {
  const std::string_view text = "  First sentence. Second without end  ";
  const auto sentences = segment_sentences(text);
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0].span.begin == 2);
  CHECK(sentences[0].terminated);
  CHECK_FALSE(sentences[1].terminated);
  CHECK(text.substr(sentences[1].span.begin, sentences[1].span.size()) == "Second without end");
}

TEST_CASE("Blank text has no sentences", "[citation]") {
  CHECK(segment_sentences("").empty());
  CHECK(segment_sentences(" \n\n\t ").empty());
}

TEST_CASE("starts_sentence recognizes sentence openings", "[citation]") {
  const std::string_view text = "One clause. Two clauses.";
  CHECK(starts_sentence(text, 0));
  CHECK(starts_sentence(text, 12));
  CHECK_FALSE(starts_sentence(text, 4));
}
