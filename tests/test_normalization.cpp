#include "cintel/core/hashing.h"
#include "cintel/core/normalization.h"
#include "cintel/core/utf8.h"

#include <catch2/catch_test_macros.hpp>

using namespace cintel::core;

TEST_CASE("tokenize_ascii lowercases and splits on punctuation", "[core][normalization]") {
  const auto tokens = tokenize_ascii("Net-30 PAYMENT, due (upon) Receipt.");
  REQUIRE(tokens == std::vector<std::string>{"net", "30", "payment", "due", "upon", "receipt"});
}

TEST_CASE("tokenize_ascii drops tokens shorter than min_length", "[core][normalization]") {
  CHECK(tokenize_ascii("a b cd e") == std::vector<std::string>{"cd"});
  CHECK(tokenize_ascii("a b cd e", 1) == std::vector<std::string>{"a", "b", "cd", "e"});
}

TEST_CASE("tokenize_ascii treats UTF-8 sequences as delimiters", "[core][normalization]") {
  const auto tokens = tokenize_ascii("caf\xC3\xA9 r\xC3\xA9sum\xC3\xA9");
  CHECK(tokens == std::vector<std::string>{"caf", "sum"});
}

TEST_CASE("tokenize_with_positions reports byte offsets", "[core][normalization]") {
  const std::string text = "  Governing Law: Delaware";
  const auto tokens = tokenize_with_positions(text);
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0].text == "governing");
  CHECK(tokens[0].begin == 2);
  CHECK(tokens[0].end == 11);
  CHECK(text.substr(tokens[2].begin, tokens[2].end - tokens[2].begin) == "Delaware");
}

TEST_CASE("content_terms removes stop words and deduplicates", "[core][normalization]") {
  const auto terms = content_terms("What is the termination notice for the termination clause?");
  CHECK(terms == std::vector<std::string>{"clause", "notice", "termination"});
}

TEST_CASE("content_terms of a stop-word-only question is empty", "[core][normalization]") {
  CHECK(content_terms("What is it?").empty());
  CHECK(content_terms("").empty());
}

TEST_CASE("is_stop_word", "[core][normalization]") {
  CHECK(is_stop_word("the"));
  CHECK(is_stop_word("which"));
  CHECK_FALSE(is_stop_word("liability"));
  CHECK_FALSE(is_stop_word("The"));
}

TEST_CASE("trim removes ASCII whitespace only at the ends", "[core][normalization]") {
  CHECK(trim("  \t a b \n") == "a b");
  CHECK(trim("   ").empty());
  CHECK(trim("x") == "x");
}

TEST_CASE("utf8_floor and utf8_ceil never split a code point", "[core][utf8]") {
  const std::string text = "a\xC3\xA9z";  // a, e-acute (2 bytes), z
  CHECK(utf8_floor(text, 2) == 1);
  CHECK(utf8_ceil(text, 2) == 3);
  CHECK(utf8_floor(text, 3) == 3);
  CHECK(utf8_floor(text, 99) == text.size());
  CHECK(utf8_ceil(text, 4) == 4);
}

TEST_CASE("stable_hash64 is FNV-1a", "[core][hashing]") {
  CHECK(stable_hash64("") == 0xcbf29ce484222325ULL);
  CHECK(stable_hash64("a") == 0xaf63dc4c8601ec8cULL);
  CHECK(stable_hash64_hex("abc") == stable_hash64_hex("abc"));
  CHECK(stable_hash64_hex("abc") != stable_hash64_hex("abd"));
  CHECK(stable_hash64_hex("abc").size() == 16);
}
