#include "localmind_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentError("Failed reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string ContentExtractor::compute_hash_from_content(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ContentError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ContentError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ContentError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ContentError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::string ContentExtractor::get_content_hash(const fs::path& file_path) const {
  return compute_hash_from_content(get_string_content(file_path));
}

std::string ContentExtractor::normalize(std::string content) const {
  std::string out;
  out.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
      continue;
    }
    out.push_back(content[i]);
  }
  return out;
}

Document ContentExtractor::extract(const fs::path& file_path) const {
  const std::string raw = get_string_content(file_path);
  if (text::is_blank(raw)) {
    throw ContentError("Document is empty: " + file_path.string());
  }
  if (!text::is_valid_utf8(raw)) {
    throw ContentError("Document is not valid UTF-8: " + file_path.string());
  }

  Document document;
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(file_path, ec);
  document.id = ec ? file_path.lexically_normal().string() : canonical.string();
  document.content_hash = compute_hash_from_content(raw);
  document.text = normalize(raw);
  document.file_type = get_file_type();
  document.ingested_at = std::chrono::system_clock::now();

  if (text::is_blank(document.text)) {
    throw ContentError("Document has no content after normalisation: " + file_path.string());
  }
  return document;
}

}  // namespace localmind_core
