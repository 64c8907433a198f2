#include "localmind_core/extractors/plaintext_extractor.hpp"

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return text::to_lower_ascii(file_path.extension().string()) == ".txt";
}

}  // namespace localmind_core
