#include "cintel/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace cintel::core {

std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
  constexpr std::uint64_t kPrime = 1099511628211ULL;

  std::uint64_t hash = kOffsetBasis;
  for (const char ch : input) {
    // ES.46: go through unsigned char so bytes >= 0x80 do not sign-extend.
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kPrime;
  }
  return hash;
}

std::string stable_hash64_hex(const std::string_view input) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << stable_hash64(input);
  return oss.str();
}

}  // namespace cintel::core
