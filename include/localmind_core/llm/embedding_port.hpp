#pragma once

#include <string>
#include <vector>

namespace localmind_core {

// Text -> fixed-length dense vector. Implementations throw
// EmbeddingUnavailableError when the backend cannot produce a vector.
class EmbeddingPort {
 public:
  virtual ~EmbeddingPort() = default;

  virtual std::vector<float> get_embedding(const std::string& text) = 0;

  // Aligned with the input.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string>& texts) = 0;
};

}  // namespace localmind_core
