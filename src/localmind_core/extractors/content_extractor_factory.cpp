#include "localmind_core/extractors/content_extractor_factory.hpp"

#include "localmind_core/extractors/markdown_extractor.hpp"
#include "localmind_core/extractors/plaintext_extractor.hpp"

namespace localmind_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw ContentError("Unsupported file type: " + file_path.string() +
                     " (supported: .txt, .md, .markdown)");
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}

}  // namespace localmind_core
