#include "cintel/citation/citation_resolver.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace cintel;
using citation::BoundaryPolicy;
using citation::CitationResolver;
using citation::Span;

namespace {

const std::string kPage =
    "Preamble of the agreement. Intro clause. The fee is 500 dollars per month. "
    "Closing remark without end";

domain::Chunk chunk_at(std::size_t start, std::size_t end) {
  return domain::Chunk{.document_id = core::DocumentId{"doc-7"},
                       .page = 2,
                       .start_offset = start,
                       .end_offset = end,
                       .text = kPage.substr(start, end - start)};
}

std::string page_at(const domain::CharRange& range) {
  return kPage.substr(range.first, range.second - range.first);
}

}  // namespace

TEST_CASE("Sentence policy widens a span to its enclosing sentence", "[citation]") {
  const auto chunk = chunk_at(27, kPage.size());
  const std::size_t fee = chunk.text.find("500");
  const CitationResolver resolver;

  const auto cite = resolver.resolve(chunk, Span{fee, fee + 3});
  CHECK(cite.document_id().value == "doc-7");
  CHECK(cite.page() == 2);
  CHECK(cite.text_snippet() == "The fee is 500 dollars per month.");
  CHECK(page_at(cite.char_range()) == cite.text_snippet());
}

TEST_CASE("Exact policy cites the span unchanged", "[citation]") {
  const auto chunk = chunk_at(27, kPage.size());
  const std::size_t fee = chunk.text.find("500");
  const CitationResolver resolver(BoundaryPolicy::kExact);

  const auto cite = resolver.resolve(chunk, Span{fee, fee + 3});
  CHECK(cite.text_snippet() == "500");
  CHECK(cite.char_range() == domain::CharRange{27 + fee, 27 + fee + 3});
  CHECK(page_at(cite.char_range()) == "500");
}

TEST_CASE("Invalid spans are rejected", "[citation]") {
  const auto chunk = chunk_at(0, 40);
  const CitationResolver resolver;
  CHECK_THROWS_AS(resolver.resolve(chunk, Span{5, 5}), std::invalid_argument);
  CHECK_THROWS_AS(resolver.resolve(chunk, Span{6, 2}), std::invalid_argument);
  CHECK_THROWS_AS(resolver.resolve(chunk, Span{0, 41}), std::invalid_argument);
}

TEST_CASE("Whole-chunk citation keeps only complete sentences", "[citation]") {
  const CitationResolver resolver;

  SECTION("chunk opening the page keeps its first sentence") {
    const auto cite = resolver.resolve(chunk_at(0, kPage.size()));
    CHECK(cite.text_snippet() ==
          "Preamble of the agreement. Intro clause. The fee is 500 dollars per month.");
    CHECK(cite.char_range().first == 0);
  }

  SECTION("chunk starting mid-sentence drops the leading fragment") {
    const auto cite = resolver.resolve(chunk_at(9, kPage.size()));
    CHECK(cite.text_snippet() == "Intro clause. The fee is 500 dollars per month.");
    CHECK(page_at(cite.char_range()) == cite.text_snippet());
  }

  SECTION("chunk without a complete sentence is cited whole") {
    const std::size_t start = kPage.find("Closing");
    const auto cite = resolver.resolve(chunk_at(start, kPage.size()));
    CHECK(cite.text_snippet() == "Closing remark without end");
  }
}
