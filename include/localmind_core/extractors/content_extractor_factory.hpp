#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

namespace localmind_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor for a file by its extension.
 *
 * Only plain text (.txt) and Markdown (.md, .markdown) are supported.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();

  /**
   * @brief Returns the first registered extractor that accepts the file.
   * @throw ContentError if the file type is not supported.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};

}  // namespace localmind_core
