#include "cintel/chunking/chunk_cache.h"

#include <mutex>

namespace cintel::chunking {

SharedChunks InMemoryChunkCache::get(const ChunkCacheKey& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(key.to_string());
  return it == entries_.end() ? nullptr : it->second;
}

SharedChunks InMemoryChunkCache::put_if_absent(const ChunkCacheKey& key, SharedChunks chunks) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto [it, inserted] = entries_.try_emplace(key.to_string(), std::move(chunks));
  return it->second;
}

std::size_t InMemoryChunkCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace cintel::chunking
