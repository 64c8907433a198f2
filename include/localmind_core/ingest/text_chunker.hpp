#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "localmind_core/text/segmenter.hpp"
#include "localmind_core/types/chunk.hpp"
#include "localmind_core/types/document.hpp"

namespace localmind_core {

struct ChunkerOptions {
  // Both measured in Unicode code points.
  size_t max_chunk_chars = 1000;
  size_t overlap_chars = 200;
};

/**
 * @class TextChunker
 * @brief Paragraph- and sentence-aware splitter with bounded overlap.
 *
 * Chunks are contiguous spans of the source text. Each chunk after the first
 * starts inside the previous one, at most overlap_chars code points before
 * its end, so the tail of chunk k is exactly the head of chunk k+1.
 *
 * Packing rules, in order:
 *  - a paragraph is only started in a chunk that already holds new text if
 *    the whole paragraph fits;
 *  - a paragraph that does not fit is split at sentence boundaries;
 *  - a sentence that does not fit is cut at the last word boundary, or at a
 *    code point when the sentence has no whitespace.
 * Markdown headings begin a new paragraph.
 */
class TextChunker {
 public:
  explicit TextChunker(ChunkerOptions options = {});

  // Throws ContentError for text that is not valid UTF-8. Blank text yields
  // no chunks. Returned chunks carry offsets, content and chunk_index only.
  std::vector<Chunk> split(const std::string& text, FileType file_type) const;

  const ChunkerOptions& options() const { return options_; }

 private:
  struct Piece {
    text::TextSpan span;
    size_t paragraph_start = 0;
    size_t paragraph_end = 0;
  };

  std::vector<Piece> build_pieces(const std::string& text, bool markdown) const;

  // Code points in [begin, end), counting stops once cap is exceeded.
  static size_t count_chars(const std::string& text, size_t begin, size_t end, size_t cap);

  size_t hard_cut(const std::string& text, size_t chunk_start, size_t from, size_t limit) const;
  size_t overlap_start(const std::string& text, size_t chunk_start, size_t chunk_end) const;

  ChunkerOptions options_;
};

}  // namespace localmind_core
