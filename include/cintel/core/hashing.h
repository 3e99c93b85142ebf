#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cintel::core {

// FNV-1a 64-bit. Stable across platforms; used for content hashes and cache keys,
// not for anything security-relevant.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

}  // namespace cintel::core
