#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace localmind_core {

// category -> trigger phrases
using CategoryDictionary = std::map<std::string, std::vector<std::string>>;

/**
 * @class KeywordClassifier
 * @brief Dictionary-driven category tagging.
 *
 * Text is lowercased and split on every code point that is not a letter or a
 * digit, so Hangul syllables, Latin words and digit runs each form tokens.
 * A trigger phrase matches a run of consecutive tokens. The final token may
 * carry a suffix: up to three Hangul syllables after a Hangul trigger
 * (particles such as 은/는/을/를/에서), or "s"/"es" after a Latin trigger.
 *
 * The result depends only on the dictionary and the input text.
 */
class KeywordClassifier {
 public:
  static constexpr const char* kFallbackCategory = "일반";

  KeywordClassifier();
  explicit KeywordClassifier(CategoryDictionary dictionary);

  static KeywordClassifier from_json(const nlohmann::json& json);
  static KeywordClassifier from_file(const std::filesystem::path& path);
  static CategoryDictionary default_dictionary();

  // Every category with at least one matching trigger. Empty for blank text.
  std::set<std::string> classify(const std::string& text) const;

  // Number of trigger matches per category. Categories without a match are
  // left out.
  std::map<std::string, int> score(const std::string& text) const;

  // Highest-scoring category, ties broken by name. Falls back to
  // kFallbackCategory when nothing matches.
  std::string primary_category(const std::string& text) const;

  std::vector<std::string> categories() const;
  const CategoryDictionary& dictionary() const { return dictionary_; }

  static std::vector<std::string> tokenize(const std::string& text);

 private:
  struct Trigger {
    std::string category;
    std::vector<std::string> tokens;
    bool hangul_tail = false;
  };

  bool matches_at(const std::vector<std::string>& tokens, size_t pos, const Trigger& trigger) const;

  CategoryDictionary dictionary_;
  std::vector<Trigger> triggers_;
};

}  // namespace localmind_core
