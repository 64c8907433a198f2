#include "localmind_core/extractors/markdown_extractor.hpp"

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  const std::string extension = text::to_lower_ascii(file_path.extension().string());
  return extension == ".md" || extension == ".markdown";
}

std::string MarkdownExtractor::normalize(std::string content) const {
  std::string text = ContentExtractor::normalize(std::move(content));

  if (text.rfind("---\n", 0) != 0) {
    return text;
  }
  const size_t close = text.find("\n---\n", 3);
  if (close == std::string::npos) {
    return text;
  }
  return text.substr(close + 5);
}

}  // namespace localmind_core
