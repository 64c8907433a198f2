#include "localmind_core/text/segmenter.hpp"

#include <algorithm>
#include <regex>

namespace localmind_core::text {

namespace {

const std::regex& paragraph_break_regex() {
  static const std::regex regex(R"(\n[ \t\r\f\v]*\n\s*)");
  return regex;
}

const std::regex& heading_regex() {
  static const std::regex regex(R"(^#{1,6}[ \t])",
                                std::regex_constants::ECMAScript | std::regex_constants::multiline);
  return regex;
}

const std::regex& sentence_end_regex() {
  static const std::regex regex(R"((?:(?:[.!?]|。|！|？)+["')\]]*\s+|\n\s*))");
  return regex;
}

std::vector<TextSpan> spans_from_points(std::vector<size_t> points, size_t begin, size_t end) {
  points.push_back(begin);
  points.push_back(end);
  std::sort(points.begin(), points.end());
  points.erase(std::unique(points.begin(), points.end()), points.end());

  std::vector<TextSpan> spans;
  for (size_t i = 0; i + 1 < points.size(); ++i) {
    if (points[i] < begin || points[i + 1] > end) {
      continue;
    }
    spans.push_back({points[i], points[i + 1]});
  }
  return spans;
}

}  // namespace

std::vector<TextSpan> split_paragraphs(const std::string& text, bool markdown_headings) {
  if (text.empty()) {
    return {};
  }

  std::vector<size_t> points;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), paragraph_break_regex());
       it != std::sregex_iterator(); ++it) {
    points.push_back(static_cast<size_t>(it->position() + it->length()));
  }
  if (markdown_headings) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), heading_regex());
         it != std::sregex_iterator(); ++it) {
      points.push_back(static_cast<size_t>(it->position()));
    }
  }
  return spans_from_points(std::move(points), 0, text.size());
}

std::vector<TextSpan> split_sentences(const std::string& text, size_t begin, size_t end) {
  if (begin >= end) {
    return {};
  }

  std::vector<size_t> points;
  auto first = text.begin() + static_cast<std::ptrdiff_t>(begin);
  auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
  for (auto it = std::sregex_iterator(first, last, sentence_end_regex()); it != std::sregex_iterator();
       ++it) {
    points.push_back(begin + static_cast<size_t>(it->position() + it->length()));
  }
  return spans_from_points(std::move(points), begin, end);
}

}  // namespace localmind_core::text
