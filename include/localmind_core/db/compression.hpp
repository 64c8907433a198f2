#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace localmind_core::compression {

// zstd frame of the input. Empty input yields an empty buffer.
std::vector<char> compress(std::string_view data, int compression_level = 3);

// Inverse of compress(). Throws StorageError on a corrupt or foreign frame.
std::string decompress(const std::vector<char>& compressed_data);

}  // namespace localmind_core::compression
