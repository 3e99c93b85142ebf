#include "cintel/chunking/chunk_cache.h"
#include "cintel/chunking/redis_chunk_cache.h"
#include "cintel/chunking/redis_config.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

using namespace cintel;
using chunking::ChunkCacheKey;
using chunking::SharedChunks;

namespace {

bool should_run_redis_tests() {
  const char* env = std::getenv("CINTEL_TEST_REDIS");
  return env != nullptr && std::string(env) == "1";
}

std::string get_redis_uri() {
  const char* env = std::getenv("CINTEL_REDIS_URI");
  if (env != nullptr) {
    return std::string(env);
  }
  return "tcp://127.0.0.1:6379";
}

SharedChunks chunk_set(const std::string& text) {
  return std::make_shared<const domain::ChunkList>(domain::ChunkList{domain::Chunk{
      .document_id = core::DocumentId{"doc-1"},
      .page = 1,
      .start_offset = 0,
      .end_offset = text.size(),
      .text = text}});
}

}  // namespace

TEST_CASE("Chunk cache key combines document, content hash and signature", "[chunking][cache]") {
  const ChunkCacheKey key{
      .document_id = "doc-1", .content_hash = "abc", .chunker_signature = "500/100"};
  CHECK(key.to_string() == "doc-1:abc:500/100");
  CHECK(chunking::RedisChunkCache::redis_key(key) == "cintel:chunks:doc-1:abc:500/100");
}

TEST_CASE("InMemoryChunkCache misses until written", "[chunking][cache]") {
  chunking::InMemoryChunkCache cache;
  const ChunkCacheKey key{.document_id = "doc-1", .content_hash = "h", .chunker_signature = "s"};
  CHECK(cache.get(key) == nullptr);

  const auto stored = cache.put_if_absent(key, chunk_set("first"));
  REQUIRE(stored != nullptr);
  CHECK(cache.get(key) == stored);
  CHECK(cache.size() == 1);
}

TEST_CASE("InMemoryChunkCache keeps the first writer", "[chunking][cache]") {
  chunking::InMemoryChunkCache cache;
  const ChunkCacheKey key{.document_id = "doc-1", .content_hash = "h", .chunker_signature = "s"};
  const auto first = cache.put_if_absent(key, chunk_set("first"));
  const auto second = cache.put_if_absent(key, chunk_set("second"));
  CHECK(second == first);
  CHECK(cache.get(key)->front().text == "first");
}

TEST_CASE("InMemoryChunkCache separates chunker configurations", "[chunking][cache]") {
  chunking::InMemoryChunkCache cache;
  const ChunkCacheKey small{
      .document_id = "doc-1", .content_hash = "h", .chunker_signature = "200/40"};
  const ChunkCacheKey large{
      .document_id = "doc-1", .content_hash = "h", .chunker_signature = "500/100"};
  (void)cache.put_if_absent(small, chunk_set("small"));
  CHECK(cache.get(large) == nullptr);
  CHECK(cache.size() == 1);
}

TEST_CASE("RedisChunkCache round-trips a chunk set", "[chunking][cache][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set CINTEL_TEST_REDIS=1 to enable)");
  }
  const auto config = chunking::parse_redis_uri(get_redis_uri());
  REQUIRE(config.has_value());

  chunking::RedisChunkCache cache(*config, std::chrono::seconds(60));
  const ChunkCacheKey key{.document_id = "redis-test-doc",
                          .content_hash = std::to_string(
                              std::chrono::system_clock::now().time_since_epoch().count()),
                          .chunker_signature = "500/100"};
  CHECK(cache.get(key) == nullptr);

  const auto stored = cache.put_if_absent(key, chunk_set("Payment is due monthly."));
  REQUIRE(stored != nullptr);
  const auto loaded = cache.get(key);
  REQUIRE(loaded != nullptr);
  CHECK(*loaded == *stored);

  const auto second = cache.put_if_absent(key, chunk_set("different"));
  REQUIRE(second != nullptr);
  CHECK(second->front().text == "Payment is due monthly.");
}

TEST_CASE("RedisChunkCache refuses an unreachable server", "[chunking][cache][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set CINTEL_TEST_REDIS=1 to enable)");
  }
  const auto config = chunking::parse_redis_uri("tcp://127.0.0.1:1");
  REQUIRE(config.has_value());
  CHECK_THROWS_AS(chunking::RedisChunkCache(*config), std::runtime_error);
}
