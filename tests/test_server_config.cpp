#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "config.h"

#include <string>
#include <vector>

using namespace cintel::server;

namespace {

ServerConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "cintel_server");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST_CASE("parse_args: no flags keeps defaults", "[config]") {
  const auto config = parse({});
  CHECK_FALSE(config.db_path.has_value());
  CHECK_FALSE(config.redis_uri.has_value());
  CHECK(config.llm == LlmBackend::kNone);
  CHECK(config.top_k == 3);
  CHECK(config.chunk_size == 500);
  CHECK(config.chunk_overlap == 0.2);
  CHECK(config.min_renewal_notice_days == 30);
  CHECK(config.max_confidentiality_years == 5);
  CHECK(config.invalid_flags.empty());
}

TEST_CASE("parse_args: every flag is applied", "[config]") {
  const auto config = parse({"--db", "/tmp/contracts.db", "--redis", "tcp://127.0.0.1:6379",
                             "--llm", "ollama", "--ollama-url", "http://gpu:11434",
                             "--ollama-model", "mistral", "--llm-timeout-ms", "30000", "--top-k",
                             "5", "--chunk-size", "800", "--chunk-overlap", "0.1",
                             "--min-renewal-notice-days", "60", "--max-confidentiality-years",
                             "3", "--help", "--version"});
  CHECK(config.db_path == std::optional<std::string>{"/tmp/contracts.db"});
  CHECK(config.redis_uri == std::optional<std::string>{"tcp://127.0.0.1:6379"});
  CHECK(config.llm == LlmBackend::kOllama);
  CHECK(config.ollama_url == "http://gpu:11434");
  CHECK(config.ollama_model == "mistral");
  CHECK(config.llm_timeout_ms == 30000);
  CHECK(config.top_k == 5);
  CHECK(config.chunk_size == 800);
  CHECK(config.chunk_overlap == 0.1);
  CHECK(config.min_renewal_notice_days == 60);
  CHECK(config.max_confidentiality_years == 3);
  CHECK(config.show_help);
  CHECK(config.show_version);
  CHECK(config.invalid_flags.empty());
}

TEST_CASE("parse_args: unparsable values are collected", "[config]") {
  const auto config = parse({"--top-k", "five", "--chunk-overlap", "0.2x", "--llm", "gpt"});
  REQUIRE(config.invalid_flags.size() == 3);
  CHECK_THAT(config.invalid_flags[0], Catch::Matchers::ContainsSubstring("--top-k"));
  CHECK_THAT(config.invalid_flags[1], Catch::Matchers::ContainsSubstring("--chunk-overlap"));
  CHECK_THAT(config.invalid_flags[2], Catch::Matchers::ContainsSubstring("--llm"));
  CHECK(config.top_k == 3);
}

TEST_CASE("parse_args: unknown flags and missing values are collected", "[config]") {
  const auto config = parse({"stray", "--verbose", "--db"});
  REQUIRE(config.invalid_flags.size() == 2);
  CHECK_THAT(config.invalid_flags[0], Catch::Matchers::ContainsSubstring("Unknown option: --verbose"));
  CHECK_THAT(config.invalid_flags[1], Catch::Matchers::ContainsSubstring("--db requires a value"));
  CHECK_FALSE(config.db_path.has_value());
}

TEST_CASE("usage_text lists every flag", "[config]") {
  const std::string usage = usage_text();
  for (const char* flag : {"--db", "--redis", "--llm", "--ollama-url", "--ollama-model",
                           "--llm-timeout-ms", "--top-k", "--chunk-size", "--chunk-overlap",
                           "--min-renewal-notice-days", "--max-confidentiality-years", "--help",
                           "--version"}) {
    CHECK_THAT(usage, Catch::Matchers::ContainsSubstring(flag));
  }
}
