#include "cintel/chunking/redis_chunk_cache.h"

#include "cintel/domain/serialization.h"

#include <sw/redis++/redis++.h>

#include <iostream>
#include <stdexcept>

namespace cintel::chunking {

RedisChunkCache::RedisChunkCache(const RedisConfig& config, const std::chrono::seconds ttl)
    : ttl_(ttl) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.redis_db;
  options.socket_timeout = std::chrono::milliseconds(500);
  try {
    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
  } catch (const sw::redis::Error& e) {
    throw std::runtime_error("Failed to connect to Redis at " +
                             redis_config_to_log_string(config) + ": " + e.what());
  }
}

RedisChunkCache::~RedisChunkCache() = default;

std::string RedisChunkCache::redis_key(const ChunkCacheKey& key) {
  return "cintel:chunks:" + key.to_string();
}

SharedChunks RedisChunkCache::get(const ChunkCacheKey& key) const {
  try {
    const sw::redis::OptionalString payload = redis_->get(redis_key(key));
    if (!payload) {
      return nullptr;
    }
    auto chunks = domain::chunks_from_json(*payload);
    if (!chunks.has_value()) {
      std::cerr << "WARNING: ignoring malformed chunk cache entry " << redis_key(key) << "\n";
      return nullptr;
    }
    return std::make_shared<const domain::ChunkList>(std::move(*chunks));
  } catch (const sw::redis::Error& e) {
    std::cerr << "WARNING: chunk cache read failed: " << e.what() << "\n";
    return nullptr;
  }
}

SharedChunks RedisChunkCache::put_if_absent(const ChunkCacheKey& key, SharedChunks chunks) {
  const std::string k = redis_key(key);
  try {
    const std::string payload = domain::chunks_to_json(*chunks).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    const bool stored = redis_->set(k, payload, ttl_, sw::redis::UpdateType::NOT_EXIST);
    if (stored) {
      return chunks;
    }
    // Lost the race; prefer the stored entry so every reader sees the same chunk set.
    SharedChunks winner = get(key);
    return winner ? winner : chunks;
  } catch (const sw::redis::Error& e) {
    std::cerr << "WARNING: chunk cache write failed: " << e.what() << "\n";
    return chunks;
  }
}

}  // namespace cintel::chunking
