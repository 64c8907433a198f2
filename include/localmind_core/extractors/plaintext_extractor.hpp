#pragma once

#include "content_extractor.hpp"

namespace localmind_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Text; }
};

}  // namespace localmind_core
