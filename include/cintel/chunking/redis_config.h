#pragma once

#include <optional>
#include <string>

namespace cintel::chunking {

// Parsed Redis URI for the shared chunk cache.
//
// Accepted:
//   tcp://host[:port]
//   redis://host[:port][/N]   N = database index
// Port defaults to 6379, database to 0.
struct RedisConfig {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{6379};    // NOLINT(readability-identifier-naming)
  int redis_db{0};   // NOLINT(readability-identifier-naming)
};

// nullopt for empty input, unknown schemes, a missing host or an invalid port or database.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// "host:port/db" for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace cintel::chunking
