#pragma once

#include <string>

namespace cintel::ingest::hygiene {

// Text normalization applied to each page before size caps and chunking.
// The normalized text is what gets stored, so citation offsets refer to it.

// Replaces every byte that is not part of a well-formed UTF-8 sequence (overlong forms,
// surrogates and truncated sequences included) with U+FFFD. Valid input is returned unchanged.
std::string repair_utf8(const std::string& text);

// \r\n and lone \r become \n.
std::string normalize_line_endings(const std::string& text);

// Strips spaces and tabs at the end of every line.
std::string trim_trailing_whitespace(const std::string& text);

// Runs of more than two blank lines become two.
std::string collapse_blank_lines(const std::string& text);

std::string apply_hygiene(const std::string& text);

}  // namespace cintel::ingest::hygiene
