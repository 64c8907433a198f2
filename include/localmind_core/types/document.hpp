#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace localmind_core {

enum class FileType { Text, Markdown, Unknown };

std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// A loaded source document. The id is the normalised source path and stays
// stable across re-ingestion.
struct Document {
  std::string id;
  std::string text;
  FileType file_type = FileType::Unknown;
  std::string content_hash;
  std::chrono::system_clock::time_point ingested_at;
};

// Row of the documents table.
struct DocumentInfo {
  std::string id;
  FileType file_type = FileType::Unknown;
  std::string content_hash;
  size_t file_size = 0;
  size_t chunk_count = 0;
  std::chrono::system_clock::time_point ingested_at;
};

}  // namespace localmind_core
