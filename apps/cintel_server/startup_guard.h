#pragma once

#include "config.h"
#include <string>

namespace cintel::server {

// validate_server_config checks startup preconditions before any component is built.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag value parsed
// - if redis_uri is present, parse_redis_uri() must succeed (format valid)
// - --ollama-url is http:// or https://, --llm-timeout-ms is positive
// - --top-k >= 1, --chunk-size >= 50, --chunk-overlap in [0, 0.5]
// - policy thresholds are non-negative
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace cintel::server
