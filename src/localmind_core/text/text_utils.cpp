#include "localmind_core/text/text_utils.hpp"

#include <utf8.h>

#include <iterator>

namespace localmind_core::text {

bool is_valid_utf8(const std::string& text) {
  return utf8::is_valid(text.begin(), text.end());
}

std::string sanitize_utf8(const std::string& text) {
  if (is_valid_utf8(text)) {
    return text;
  }
  std::string out;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(out));
  return out;
}

size_t char_count(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string truncate_chars(const std::string& text, size_t max_chars) {
  auto it = text.begin();
  size_t count = 0;
  while (it != text.end() && count < max_chars) {
    utf8::next(it, text.end());
    ++count;
  }
  return std::string(text.begin(), it);
}

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_blank(const std::string& text) {
  for (char c : text) {
    if (!is_ascii_space(c)) {
      return false;
    }
  }
  return true;
}

std::string to_lower_ascii(const std::string& text) {
  std::string out = text;
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

}  // namespace localmind_core::text
