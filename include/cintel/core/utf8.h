#pragma once

#include <cstddef>
#include <string_view>

namespace cintel::core {

// True when the byte starts a UTF-8 sequence (or is ASCII).
inline constexpr bool is_utf8_lead_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U;
}

// Largest position <= pos that does not split a UTF-8 sequence.
inline std::size_t utf8_floor(const std::string_view text, std::size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  while (pos > 0 && !is_utf8_lead_byte(text[pos])) {
    --pos;
  }
  return pos;
}

// Smallest position >= pos that does not split a UTF-8 sequence.
inline std::size_t utf8_ceil(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && !is_utf8_lead_byte(text[pos])) {
    ++pos;
  }
  return pos < text.size() ? pos : text.size();
}

}  // namespace cintel::core
