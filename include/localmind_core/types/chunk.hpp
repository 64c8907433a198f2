#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace localmind_core {

// Chunk ids double as vector-index ids. They come from the chunks table's
// AUTOINCREMENT column and are never reused.
using ChunkId = std::int64_t;

struct Chunk {
  ChunkId id = 0;
  std::string document_id;
  int chunk_index = 0;
  // Byte offsets of the span in the source document text.
  size_t start_offset = 0;
  size_t end_offset = 0;
  std::string content;
  std::set<std::string> categories;
  std::vector<float> vector_embedding;
};

struct ScoredChunkId {
  ChunkId id = 0;
  float score = 0.0f;
};

// Ordered by score descending, ties by id ascending.
using RetrievalResult = std::vector<ScoredChunkId>;

}  // namespace localmind_core
