#include "localmind_core/classify/keyword_classifier.hpp"

#include <utf8.h>

#include <cstdint>
#include <fstream>
#include <iterator>

#include "localmind_core/errors.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

bool is_hangul(std::uint32_t cp) {
  return (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0x1100 && cp <= 0x11FF) ||
         (cp >= 0x3130 && cp <= 0x318F);
}

bool is_token_char(std::uint32_t cp) {
  if ((cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) {
    return true;
  }
  // Latin-1 letters, minus the multiplication and division signs.
  if (cp >= 0xC0 && cp <= 0xFF && cp != 0xD7 && cp != 0xF7) {
    return true;
  }
  if (is_hangul(cp)) {
    return true;
  }
  // Kana and CJK unified ideographs.
  return (cp >= 0x3040 && cp <= 0x30FF) || (cp >= 0x4E00 && cp <= 0x9FFF);
}

std::uint32_t to_lower(std::uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') {
    return cp + 0x20;
  }
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
    return cp + 0x20;
  }
  return cp;
}

bool ends_with_hangul(const std::string& token) {
  if (token.empty()) {
    return false;
  }
  auto it = token.end();
  std::uint32_t last = utf8::prior(it, token.begin());
  return is_hangul(last);
}

}  // namespace

KeywordClassifier::KeywordClassifier() : KeywordClassifier(default_dictionary()) {}

KeywordClassifier::KeywordClassifier(CategoryDictionary dictionary) : dictionary_(std::move(dictionary)) {
  for (const auto& [category, phrases] : dictionary_) {
    if (category.empty()) {
      throw InvalidArgumentError("Category names must not be empty");
    }
    for (const auto& phrase : phrases) {
      Trigger trigger{.category = category, .tokens = tokenize(phrase)};
      if (trigger.tokens.empty()) {
        continue;
      }
      trigger.hangul_tail = ends_with_hangul(trigger.tokens.back());
      triggers_.push_back(std::move(trigger));
    }
  }
}

CategoryDictionary KeywordClassifier::default_dictionary() {
  return {
      {"기술",
       {"프로그래밍", "개발", "코딩", "알고리즘", "AI", "인공지능", "머신러닝", "딥러닝", "데이터",
        "분석", "시스템", "서버", "데이터베이스", "웹", "앱"}},
      {"업무",
       {"회의", "프로젝트", "업무", "일정", "계획", "보고서", "문서", "발표", "팀", "협업", "관리",
        "성과", "목표", "전략", "마케팅"}},
      {"학습",
       {"공부", "학습", "교육", "강의", "책", "논문", "연구", "시험", "과제", "지식", "이해", "설명",
        "개념", "이론", "실습"}},
      {"일반",
       {"질문", "답변", "도움", "문제", "해결", "방법", "정보", "내용", "설명", "예시", "경우", "상황",
        "결과", "이유", "목적"}},
  };
}

KeywordClassifier KeywordClassifier::from_json(const nlohmann::json& json) {
  // Accepts either the bare map or {"categories": {...}}.
  const nlohmann::json& root = json.contains("categories") ? json.at("categories") : json;
  if (!root.is_object()) {
    throw InvalidArgumentError("Category dictionary must be a JSON object");
  }

  CategoryDictionary dictionary;
  for (const auto& [category, triggers] : root.items()) {
    if (!triggers.is_array()) {
      throw InvalidArgumentError("Triggers for category '" + category + "' must be an array");
    }
    auto& phrases = dictionary[category];
    for (const auto& trigger : triggers) {
      if (!trigger.is_string()) {
        throw InvalidArgumentError("Trigger in category '" + category + "' is not a string");
      }
      phrases.push_back(trigger.get<std::string>());
    }
  }
  return KeywordClassifier(std::move(dictionary));
}

KeywordClassifier KeywordClassifier::from_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw InvalidArgumentError("Could not open category dictionary: " + path.string());
  }
  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidArgumentError("Invalid category dictionary " + path.string() + ": " + e.what());
  }
  return from_json(json);
}

std::vector<std::string> KeywordClassifier::tokenize(const std::string& text) {
  const std::string clean = text::sanitize_utf8(text);

  std::vector<std::string> tokens;
  std::string current;
  auto it = clean.begin();
  while (it != clean.end()) {
    std::uint32_t cp = utf8::next(it, clean.end());
    if (is_token_char(cp)) {
      utf8::append(to_lower(cp), std::back_inserter(current));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool KeywordClassifier::matches_at(const std::vector<std::string>& tokens,
                                   size_t pos,
                                   const Trigger& trigger) const {
  const size_t n = trigger.tokens.size();
  if (pos + n > tokens.size()) {
    return false;
  }
  for (size_t j = 0; j + 1 < n; ++j) {
    if (tokens[pos + j] != trigger.tokens[j]) {
      return false;
    }
  }

  const std::string& token = tokens[pos + n - 1];
  const std::string& tail = trigger.tokens.back();
  if (token.size() < tail.size() || token.compare(0, tail.size(), tail) != 0) {
    return false;
  }
  const std::string suffix = token.substr(tail.size());
  if (suffix.empty()) {
    return true;
  }

  if (trigger.hangul_tail) {
    size_t syllables = 0;
    auto it = suffix.begin();
    while (it != suffix.end()) {
      if (!is_hangul(utf8::next(it, suffix.end()))) {
        return false;
      }
      ++syllables;
    }
    return syllables <= 3;
  }
  return suffix == "s" || suffix == "es";
}

std::map<std::string, int> KeywordClassifier::score(const std::string& text) const {
  std::map<std::string, int> scores;
  if (text::is_blank(text)) {
    return scores;
  }

  const auto tokens = tokenize(text);
  for (size_t pos = 0; pos < tokens.size(); ++pos) {
    for (const auto& trigger : triggers_) {
      if (matches_at(tokens, pos, trigger)) {
        ++scores[trigger.category];
      }
    }
  }
  return scores;
}

std::set<std::string> KeywordClassifier::classify(const std::string& text) const {
  std::set<std::string> result;
  for (const auto& [category, count] : score(text)) {
    result.insert(category);
  }
  return result;
}

std::string KeywordClassifier::primary_category(const std::string& text) const {
  std::string best = kFallbackCategory;
  int best_score = 0;
  // std::map iterates by name, so the first strict maximum wins ties.
  for (const auto& [category, count] : score(text)) {
    if (count > best_score) {
      best = category;
      best_score = count;
    }
  }
  return best;
}

std::vector<std::string> KeywordClassifier::categories() const {
  std::vector<std::string> names;
  for (const auto& [category, phrases] : dictionary_) {
    names.push_back(category);
  }
  return names;
}

}  // namespace localmind_core
