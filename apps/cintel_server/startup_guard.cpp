#include "startup_guard.h"

#include "cintel/chunking/chunker.h"
#include "cintel/chunking/redis_config.h"

namespace cintel::server {

namespace {

constexpr long kMinChunkSize = 50;

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string validate_server_config(const ServerConfig& config) {
  if (!config.invalid_flags.empty()) {
    return "Error: " + config.invalid_flags.front();
  }

  // Redis is optional, but a malformed URI is a configuration mistake, not a reason to fall
  // back to the in-memory cache.
  if (config.redis_uri.has_value() &&
      !chunking::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port/db, tcp://host";
  }

  if (!starts_with(config.ollama_url, "http://") && !starts_with(config.ollama_url, "https://")) {
    return "Error: --ollama-url '" + config.ollama_url + "' must start with http:// or https://";
  }
  if (config.llm_timeout_ms <= 0) {
    return "Error: --llm-timeout-ms must be positive";
  }

  if (config.top_k < 1) {
    return "Error: --top-k must be at least 1";
  }
  if (config.chunk_size < kMinChunkSize) {
    return "Error: --chunk-size must be at least " + std::to_string(kMinChunkSize) + " bytes";
  }
  if (config.chunk_size > static_cast<long>(chunking::kMaxTargetSize)) {
    return "Error: --chunk-size must be at most " + std::to_string(chunking::kMaxTargetSize) +
           " bytes";
  }
  if (!(config.chunk_overlap >= 0.0 && config.chunk_overlap <= 0.5)) {
    return "Error: --chunk-overlap must be within [0, 0.5]";
  }

  if (config.min_renewal_notice_days < 0) {
    return "Error: --min-renewal-notice-days must not be negative";
  }
  if (config.max_confidentiality_years < 0) {
    return "Error: --max-confidentiality-years must not be negative";
  }

  return "";
}

}  // namespace cintel::server
