#include "localmind_core/db/compression.hpp"

#include <zstd.h>

#include "localmind_core/errors.hpp"

namespace localmind_core::compression {

namespace {
// Guards against allocating from a corrupt frame header.
constexpr unsigned long long kMaxDecompressedSize = 512ULL * 1024 * 1024;
}  // namespace

std::vector<char> compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> buffer(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw StorageError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  buffer.resize(written);
  return buffer;
}

std::string decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw StorageError("Stored chunk content is not a sized zstd frame");
  }
  if (expected > kMaxDecompressedSize) {
    throw StorageError("Stored chunk content declares an implausible size: " +
                       std::to_string(expected));
  }

  std::string out(static_cast<size_t>(expected), '\0');
  const size_t actual =
      ZSTD_decompress(out.data(), out.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual)) {
    throw StorageError("zstd decompression failed: " + std::string(ZSTD_getErrorName(actual)));
  }
  if (actual != expected) {
    throw StorageError("zstd decompression produced " + std::to_string(actual) +
                       " bytes, expected " + std::to_string(expected));
  }
  return out;
}

}  // namespace localmind_core::compression
