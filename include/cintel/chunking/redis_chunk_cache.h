#pragma once

#include "cintel/chunking/chunk_cache.h"
#include "cintel/chunking/redis_config.h"

#include <chrono>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}  // namespace sw::redis

namespace cintel::chunking {

// Chunk sets shared between server processes through Redis, stored as JSON under
// "cintel:chunks:<document_id>:<content_hash>:<signature>" with SET NX so the first writer
// wins. Redis errors degrade to cache misses; callers then chunk locally.
class RedisChunkCache final : public IChunkCache {
 public:
  // Throws std::runtime_error when Redis cannot be reached.
  explicit RedisChunkCache(const RedisConfig& config,
                           std::chrono::seconds ttl = std::chrono::hours(24));
  ~RedisChunkCache() override;

  RedisChunkCache(const RedisChunkCache&) = delete;
  RedisChunkCache& operator=(const RedisChunkCache&) = delete;
  RedisChunkCache(RedisChunkCache&&) = delete;
  RedisChunkCache& operator=(RedisChunkCache&&) = delete;

  [[nodiscard]] SharedChunks get(const ChunkCacheKey& key) const override;
  SharedChunks put_if_absent(const ChunkCacheKey& key, SharedChunks chunks) override;

  [[nodiscard]] static std::string redis_key(const ChunkCacheKey& key);

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::chrono::seconds ttl_;
};

}  // namespace cintel::chunking
