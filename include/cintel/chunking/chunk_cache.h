#pragma once

#include "cintel/domain/chunk.h"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace cintel::chunking {

using SharedChunks = std::shared_ptr<const domain::ChunkList>;

// Cache key: the document, the hash of its page text and the chunker signature.
// Documents are immutable, so an entry is never replaced once written.
struct ChunkCacheKey {
  std::string document_id;      // NOLINT(readability-identifier-naming)
  std::string content_hash;     // NOLINT(readability-identifier-naming)
  std::string chunker_signature;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::string to_string() const {
    return document_id + ":" + content_hash + ":" + chunker_signature;
  }
};

// Write-once chunk set cache shared by the answer and audit paths.
class IChunkCache {
 public:
  virtual ~IChunkCache() = default;

  // nullptr on miss.
  [[nodiscard]] virtual SharedChunks get(const ChunkCacheKey& key) const = 0;

  // Stores chunks unless the key is already present, and returns whichever entry is now
  // cached. Racing writers computed identical chunks, so either may win.
  virtual SharedChunks put_if_absent(const ChunkCacheKey& key, SharedChunks chunks) = 0;

 protected:
  IChunkCache() = default;
  IChunkCache(const IChunkCache&) = default;
  IChunkCache& operator=(const IChunkCache&) = default;
  IChunkCache(IChunkCache&&) = default;
  IChunkCache& operator=(IChunkCache&&) = default;
};

class InMemoryChunkCache final : public IChunkCache {
 public:
  [[nodiscard]] SharedChunks get(const ChunkCacheKey& key) const override;
  SharedChunks put_if_absent(const ChunkCacheKey& key, SharedChunks chunks) override;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, SharedChunks> entries_;
};

}  // namespace cintel::chunking
