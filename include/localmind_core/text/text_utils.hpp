#pragma once

#include <cstddef>
#include <string>

namespace localmind_core::text {

bool is_valid_utf8(const std::string& text);

// Invalid sequences are replaced with U+FFFD.
std::string sanitize_utf8(const std::string& text);

// Number of code points. Text must be valid UTF-8.
size_t char_count(const std::string& text);

// First max_chars code points, never splitting a sequence.
std::string truncate_chars(const std::string& text, size_t max_chars);

bool is_blank(const std::string& text);
bool is_ascii_space(char c);

// ASCII-only lowercase; other bytes are copied through.
std::string to_lower_ascii(const std::string& text);

}  // namespace localmind_core::text
