#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "localmind_core/errors.hpp"
#include "localmind_core/types/document.hpp"

namespace fs = std::filesystem;

namespace localmind_core {

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  // Reads the file into a Document keyed by its canonical path. The hash is
  // taken over the raw bytes. Throws ContentError if the file cannot be read,
  // is empty or blank, or is not valid UTF-8.
  Document extract(const fs::path& file_path) const;

  std::string get_content_hash(const fs::path& file_path) const;

  static std::string compute_hash_from_content(const std::string& content);

 protected:
  std::string get_string_content(const fs::path& file_path) const;

  // Format-specific cleanup applied before chunking. The default folds CRLF
  // line endings to LF.
  virtual std::string normalize(std::string content) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace localmind_core
