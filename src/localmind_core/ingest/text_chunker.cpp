#include "localmind_core/ingest/text_chunker.hpp"

#include "localmind_core/errors.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

bool is_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t next_code_point(const std::string& text, size_t pos) {
  ++pos;
  while (pos < text.size() && is_continuation(text[pos])) {
    ++pos;
  }
  return pos;
}

size_t prior_code_point(const std::string& text, size_t pos) {
  --pos;
  while (pos > 0 && is_continuation(text[pos])) {
    --pos;
  }
  return pos;
}

}  // namespace

TextChunker::TextChunker(ChunkerOptions options) : options_(options) {
  if (options_.max_chunk_chars == 0) {
    throw InvalidArgumentError("max_chunk_chars must be positive");
  }
  if (options_.overlap_chars >= options_.max_chunk_chars) {
    throw InvalidArgumentError("overlap_chars must be smaller than max_chunk_chars");
  }
}

size_t TextChunker::count_chars(const std::string& text, size_t begin, size_t end, size_t cap) {
  size_t count = 0;
  for (size_t pos = begin; pos < end && count <= cap; ++pos) {
    if (!is_continuation(text[pos])) {
      ++count;
    }
  }
  return count;
}

std::vector<TextChunker::Piece> TextChunker::build_pieces(const std::string& text, bool markdown) const {
  std::vector<Piece> pieces;
  for (const auto& paragraph : text::split_paragraphs(text, markdown)) {
    for (const auto& sentence : text::split_sentences(text, paragraph.start, paragraph.end)) {
      pieces.push_back({sentence, paragraph.start, paragraph.end});
    }
  }
  return pieces;
}

size_t TextChunker::hard_cut(const std::string& text, size_t chunk_start, size_t from, size_t limit) const {
  size_t pos = chunk_start;
  size_t count = 0;
  while (pos < limit && count < options_.max_chunk_chars) {
    pos = next_code_point(text, pos);
    ++count;
  }

  // Prefer the last word boundary past `from`.
  for (size_t candidate = pos; candidate > from; --candidate) {
    if (text::is_ascii_space(text[candidate - 1]) && candidate < limit &&
        !text::is_ascii_space(text[candidate])) {
      return candidate;
    }
  }
  return pos;
}

size_t TextChunker::overlap_start(const std::string& text, size_t chunk_start, size_t chunk_end) const {
  size_t start = chunk_end;
  for (size_t k = 0; k < options_.overlap_chars; ++k) {
    size_t prior = prior_code_point(text, start);
    if (prior <= chunk_start) {
      break;
    }
    start = prior;
  }
  if (start == chunk_end) {
    return chunk_end;
  }

  // Snap forward to the next word start so the overlap does not open mid-word.
  for (size_t pos = start; pos < chunk_end; ++pos) {
    if (!text::is_ascii_space(text[pos]) && (pos == 0 || text::is_ascii_space(text[pos - 1]))) {
      return pos;
    }
  }
  return start;
}

std::vector<Chunk> TextChunker::split(const std::string& text, FileType file_type) const {
  if (!text::is_valid_utf8(text)) {
    throw ContentError("Text is not valid UTF-8");
  }

  size_t start = 0;
  while (start < text.size() && text::is_ascii_space(text[start])) {
    ++start;
  }
  if (start == text.size()) {
    return {};
  }

  const std::vector<Piece> pieces = build_pieces(text, file_type == FileType::Markdown);
  const size_t max_chars = options_.max_chunk_chars;

  std::vector<Chunk> chunks;
  size_t chunk_start = start;
  size_t end = start;
  size_t i = 0;

  while (end < text.size()) {
    while (i < pieces.size() && pieces[i].span.end <= end) {
      ++i;
    }

    bool has_new = false;
    while (i < pieces.size()) {
      const Piece& piece = pieces[i];

      if (has_new && end == piece.paragraph_start) {
        if (count_chars(text, chunk_start, piece.paragraph_end, max_chars) > max_chars) {
          break;
        }
        end = piece.paragraph_end;
        while (i < pieces.size() && pieces[i].span.end <= end) {
          ++i;
        }
        continue;
      }

      if (count_chars(text, chunk_start, piece.span.end, max_chars) <= max_chars) {
        end = piece.span.end;
        has_new = true;
        ++i;
        continue;
      }
      if (!has_new) {
        end = hard_cut(text, chunk_start, end, piece.span.end);
        has_new = true;
      }
      break;
    }

    const std::string content = text.substr(chunk_start, end - chunk_start);
    if (!text::is_blank(content)) {
      Chunk chunk;
      chunk.chunk_index = static_cast<int>(chunks.size());
      chunk.start_offset = chunk_start;
      chunk.end_offset = end;
      chunk.content = content;
      chunks.push_back(std::move(chunk));
    }

    size_t rest = end;
    while (rest < text.size() && text::is_ascii_space(text[rest])) {
      ++rest;
    }
    if (rest == text.size()) {
      break;
    }
    chunk_start = overlap_start(text, chunk_start, end);
  }

  return chunks;
}

}  // namespace localmind_core
