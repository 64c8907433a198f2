#include "localmind_core/classify/keyword_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

bool is_word_char(std::uint32_t cp) {
  return (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

}  // namespace

KeywordExtractor::KeywordExtractor() : stopwords_(default_stopwords()) {}

KeywordExtractor::KeywordExtractor(std::set<std::string> stopwords) : stopwords_(std::move(stopwords)) {}

std::set<std::string> KeywordExtractor::default_stopwords() {
  return {"이",      "그",      "저",       "것",       "수",      "등",      "들",     "및",
          "또는",    "그리고",  "하지만",   "그러나",   "따라서",  "그래서",  "또한",   "즉",
          "있다",    "없다",    "이다",     "아니다",   "되다",    "하다",    "가다",   "오다",
          "보다",    "주다",    "받다",     "말하다",   "생각하다", "알다",   "모르다", "좋다",
          "나쁘다",  "크다",    "작다",     "많다",     "적다",    "높다",    "낮다",   "안녕하세요",
          "감사합니다", "죄송합니다", "네",  "아니요",   "예",      "뭐",      "어떤",   "어떻게",
          "왜",      "언제",    "어디서",   "누가",     "무엇을"};
}

std::vector<std::string> KeywordExtractor::extract(const std::string& text, size_t max_keywords) const {
  if (max_keywords == 0 || text::is_blank(text)) {
    return {};
  }

  const std::string clean = text::sanitize_utf8(text);
  std::vector<std::string> order;
  std::map<std::string, size_t> counts;

  auto consider = [&](std::string word, size_t length) {
    if (length < 2 || stopwords_.count(word) > 0) {
      return;
    }
    if (counts[word]++ == 0) {
      order.push_back(std::move(word));
    }
  };

  std::string word;
  size_t length = 0;
  auto it = clean.begin();
  while (it != clean.end()) {
    std::uint32_t cp = utf8::next(it, clean.end());
    if (is_word_char(cp)) {
      utf8::append(cp, std::back_inserter(word));
      ++length;
    } else if (!word.empty()) {
      consider(std::move(word), length);
      word.clear();
      length = 0;
    }
  }
  if (!word.empty()) {
    consider(std::move(word), length);
  }

  // order holds first occurrences, so a stable sort keeps that as the tie-break.
  std::stable_sort(order.begin(), order.end(),
                   [&](const std::string& a, const std::string& b) { return counts[a] > counts[b]; });
  if (order.size() > max_keywords) {
    order.resize(max_keywords);
  }
  return order;
}

}  // namespace localmind_core
