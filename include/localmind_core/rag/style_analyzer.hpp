#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "localmind_core/classify/keyword_extractor.hpp"

namespace localmind_core {

struct StyleProfile {
  size_t sentence_count = 0;
  // Sentence lengths in code points.
  double mean_sentence_chars = 0.0;
  double stddev_sentence_chars = 0.0;
  size_t min_sentence_chars = 0;
  size_t max_sentence_chars = 0;
  std::vector<std::string> vocabulary;
  // formal, polite, plain, casual or neutral
  std::string formality = "neutral";
  std::map<std::string, size_t> formality_markers;

  nlohmann::json to_json() const;

  // Instructions handed to the generator as GenerationConstraints::style_guide.
  std::string to_constraints() const;
};

// Summarises exemplar text into a StyleProfile.
class StyleAnalyzer {
 public:
  static constexpr size_t kVocabularySize = 15;

  explicit StyleAnalyzer(std::shared_ptr<KeywordExtractor> extractor);

  StyleProfile analyze(const std::string& exemplar) const;

 private:
  std::shared_ptr<KeywordExtractor> extractor_;
};

}  // namespace localmind_core
