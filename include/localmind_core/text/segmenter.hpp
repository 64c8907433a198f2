#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace localmind_core::text {

// Half-open byte range into a source string.
struct TextSpan {
  size_t start = 0;
  size_t end = 0;

  size_t length() const { return end - start; }
};

// Contiguous spans covering the whole text. A paragraph owns the blank-line
// run that follows it. With markdown_headings, ATX headings ("# ...") also
// start a new paragraph.
std::vector<TextSpan> split_paragraphs(const std::string& text, bool markdown_headings);

// Contiguous spans covering [begin, end). A sentence ends after its
// terminator run (. ! ? and their CJK full-width forms), closing quotes or
// brackets, and trailing whitespace. A line break also ends a sentence.
std::vector<TextSpan> split_sentences(const std::string& text, size_t begin, size_t end);

}  // namespace localmind_core::text
