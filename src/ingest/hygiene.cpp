#include "cintel/ingest/hygiene.h"

#include <sstream>
#include <string_view>

namespace cintel::ingest::hygiene {

namespace {

// getline drops the final newline; restore the input's ending.
void match_final_newline(const std::string& original, std::string& result) {
  const bool original_ends_with_newline = !original.empty() && original.back() == '\n';
  if (!original_ends_with_newline && !result.empty() && result.back() == '\n') {
    result.pop_back();
  }
}

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

bool is_continuation(const unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

// Length of the well-formed sequence starting at text[pos], or 0.
std::size_t valid_sequence_length(const std::string& text, const std::size_t pos) {
  const auto at = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };
  const unsigned char lead = at(pos);
  if (lead < 0x80U) {
    return 1;
  }
  std::size_t length = 0;
  unsigned char second_min = 0x80U;
  unsigned char second_max = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    if (lead == 0xE0U) {
      second_min = 0xA0U;
    } else if (lead == 0xEDU) {
      second_max = 0x9FU;
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    if (lead == 0xF0U) {
      second_min = 0x90U;
    } else if (lead == 0xF4U) {
      second_max = 0x8FU;
    }
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  if (at(pos + 1) < second_min || at(pos + 1) > second_max) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    if (!is_continuation(at(pos + i))) {
      return 0;
    }
  }
  return length;
}

}  // namespace

std::string repair_utf8(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t length = valid_sequence_length(text, pos);
    if (length == 0) {
      result += kReplacementCharacter;
      ++pos;
      continue;
    }
    result.append(text, pos, length);
    pos += length;
  }
  return result;
}

std::string normalize_line_endings(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\r') {
      result += text[i];
      continue;
    }
    result += '\n';
    if (i + 1 < text.size() && text[i + 1] == '\n') {
      ++i;
    }
  }
  return result;
}

std::string trim_trailing_whitespace(const std::string& text) {
  std::istringstream stream(text);
  std::string line;
  std::string result;
  result.reserve(text.size());

  while (std::getline(stream, line)) {
    std::size_t end = line.size();
    while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t')) {
      --end;
    }
    result.append(line, 0, end);
    result += '\n';
  }
  match_final_newline(text, result);
  return result;
}

std::string collapse_blank_lines(const std::string& text) {
  std::istringstream stream(text);
  std::string line;
  std::string result;
  result.reserve(text.size());
  int blank_run = 0;

  while (std::getline(stream, line)) {
    if (line.empty()) {
      if (++blank_run <= 2) {
        result += '\n';
      }
      continue;
    }
    blank_run = 0;
    result += line;
    result += '\n';
  }
  match_final_newline(text, result);
  return result;
}

std::string apply_hygiene(const std::string& text) {
  return collapse_blank_lines(trim_trailing_whitespace(normalize_line_endings(text)));
}

}  // namespace cintel::ingest::hygiene
