#pragma once

#include <set>
#include <string>
#include <vector>

namespace localmind_core {

// Frequency-ranked keywords. Words are runs of Hangul syllables or ASCII
// letters; words shorter than two code points and stopwords are dropped.
class KeywordExtractor {
 public:
  static constexpr size_t kDefaultMaxKeywords = 10;

  KeywordExtractor();
  explicit KeywordExtractor(std::set<std::string> stopwords);

  // Ordered by frequency descending, ties by first occurrence.
  std::vector<std::string> extract(const std::string& text,
                                   size_t max_keywords = kDefaultMaxKeywords) const;

  static std::set<std::string> default_stopwords();

 private:
  std::set<std::string> stopwords_;
};

}  // namespace localmind_core
