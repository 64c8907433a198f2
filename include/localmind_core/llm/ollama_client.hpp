#pragma once

#include <string>
#include <vector>

#include "localmind_core/llm/embedding_port.hpp"
#include "localmind_core/llm/generation_port.hpp"

namespace localmind_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OllamaClientOptions {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";
  int embedding_timeout_seconds = 30;
  int generation_timeout_seconds = 120;
};

/**
 * @class OllamaClient
 * @brief Embedding and generation ports backed by a local Ollama server.
 *
 * Failures of the HTTP layer or malformed responses surface as
 * EmbeddingUnavailableError / GenerationUnavailableError. A reply that is a
 * single tool call is returned as GenerationResult::tool_call.
 */
class OllamaClient : public EmbeddingPort, public GenerationPort {
 public:
  explicit OllamaClient(const OllamaClientOptions &options);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  GenerationResult generate(const std::string &prompt, const GenerationConstraints &constraints) override;

  virtual bool is_server_available();

  const OllamaClientOptions &options() const { return options_; }

 private:
  OllamaClientOptions options_;

  void setup_server_connection();
};

}  // namespace localmind_core
