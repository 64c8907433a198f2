#pragma once

#include "content_extractor.hpp"

namespace localmind_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Markdown; }

 protected:
  // Also drops a leading YAML front-matter block.
  std::string normalize(std::string content) const override;
};

}  // namespace localmind_core
