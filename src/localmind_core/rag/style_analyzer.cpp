#include "localmind_core/rag/style_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>

#include "localmind_core/text/segmenter.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Drops trailing whitespace, terminators and closing quotes.
std::string sentence_body(const std::string& sentence) {
  std::string body = sentence;
  while (!body.empty()) {
    const char c = body.back();
    if (text::is_ascii_space(c) || c == '.' || c == '!' || c == '?' || c == '"' || c == '\'' || c == ')') {
      body.pop_back();
      continue;
    }
    // Full-width terminators 。！？ are three bytes each.
    if (ends_with(body, "。") || ends_with(body, "！") || ends_with(body, "？")) {
      body.resize(body.size() - 3);
      continue;
    }
    break;
  }
  return body;
}

std::string marker_for(const std::string& sentence) {
  const std::string body = sentence_body(sentence);
  if (ends_with(body, "니다") || ends_with(body, "니까")) {
    return "formal";
  }
  if (ends_with(body, "요")) {
    return "polite";
  }
  if (ends_with(body, "다") || ends_with(body, "까")) {
    return "plain";
  }
  const std::string lower = text::to_lower_ascii(body);
  for (const char* contraction : {"n't", "'m", "'re", "'ll", "'ve", "'d"}) {
    if (lower.find(contraction) != std::string::npos) {
      return "casual";
    }
  }
  return "";
}

}  // namespace

nlohmann::json StyleProfile::to_json() const {
  return {{"sentence_count", sentence_count},
          {"mean_sentence_chars", mean_sentence_chars},
          {"stddev_sentence_chars", stddev_sentence_chars},
          {"min_sentence_chars", min_sentence_chars},
          {"max_sentence_chars", max_sentence_chars},
          {"vocabulary", vocabulary},
          {"formality", formality},
          {"formality_markers", formality_markers}};
}

std::string StyleProfile::to_constraints() const {
  if (sentence_count == 0) {
    return "";
  }
  std::stringstream ss;
  ss << "Write in the style of the user's exemplar text.\n";
  ss << "- Sentences average about " << static_cast<long>(std::lround(mean_sentence_chars))
     << " characters (range " << min_sentence_chars << "-" << max_sentence_chars << ").\n";
  if (formality == "formal") {
    ss << "- Use formal endings (-습니다/-니다).\n";
  } else if (formality == "polite") {
    ss << "- Use polite endings (-요).\n";
  } else if (formality == "plain") {
    ss << "- Use plain declarative endings (-다).\n";
  } else if (formality == "casual") {
    ss << "- Keep a casual tone; contractions are fine.\n";
  }
  if (!vocabulary.empty()) {
    ss << "- Prefer this vocabulary where it fits: ";
    for (size_t i = 0; i < vocabulary.size(); ++i) {
      ss << (i > 0 ? ", " : "") << vocabulary[i];
    }
    ss << ".\n";
  }
  return ss.str();
}

StyleAnalyzer::StyleAnalyzer(std::shared_ptr<KeywordExtractor> extractor) : extractor_(std::move(extractor)) {}

StyleProfile StyleAnalyzer::analyze(const std::string& exemplar) const {
  StyleProfile profile;
  const std::string text = text::sanitize_utf8(exemplar);
  if (text::is_blank(text)) {
    return profile;
  }

  std::vector<size_t> lengths;
  for (const auto& span : text::split_sentences(text, 0, text.size())) {
    const std::string sentence = text.substr(span.start, span.length());
    if (text::is_blank(sentence)) {
      continue;
    }
    const std::string body = sentence_body(sentence);
    lengths.push_back(text::char_count(body));

    const std::string marker = marker_for(sentence);
    if (!marker.empty()) {
      ++profile.formality_markers[marker];
    }
  }
  if (lengths.empty()) {
    return profile;
  }

  profile.sentence_count = lengths.size();
  double sum = 0.0;
  for (size_t length : lengths) {
    sum += static_cast<double>(length);
  }
  profile.mean_sentence_chars = sum / static_cast<double>(lengths.size());
  double variance = 0.0;
  for (size_t length : lengths) {
    const double d = static_cast<double>(length) - profile.mean_sentence_chars;
    variance += d * d;
  }
  profile.stddev_sentence_chars = std::sqrt(variance / static_cast<double>(lengths.size()));
  profile.min_sentence_chars = *std::min_element(lengths.begin(), lengths.end());
  profile.max_sentence_chars = *std::max_element(lengths.begin(), lengths.end());

  size_t best = 0;
  for (const auto& [marker, count] : profile.formality_markers) {
    if (count > best) {
      best = count;
      profile.formality = marker;
    }
  }

  profile.vocabulary = extractor_->extract(text, kVocabularySize);
  return profile;
}

}  // namespace localmind_core
