#include "localmind_core/llm/ollama_client.hpp"

#include <algorithm>
#include <iostream>

#include "localmind_core/errors.hpp"
#include "localmind_core/llm/tool_call_parser.hpp"
#include "ollama.hpp"

namespace localmind_core {

OllamaClient::OllamaClient(const OllamaClientOptions &options) : options_(options) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(options_.url);
  ollama::setReadTimeout(std::max(options_.embedding_timeout_seconds, options_.generation_timeout_seconds));
  ollama::setWriteTimeout(options_.embedding_timeout_seconds);
  // The server may come up after us; calls fail individually until it does.
  if (!ollama::is_running()) {
    std::cerr << "[OllamaClient] Warning: Ollama server is not reachable at " << options_.url
              << std::endl;
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(options_.embedding_model, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const OllamaError &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(get_embedding(text));
  }
  return out;
}

GenerationResult OllamaClient::generate(const std::string &prompt,
                                        const GenerationConstraints &constraints) {
  ollama::options options;
  options["temperature"] = constraints.temperature;
  options["top_p"] = constraints.top_p;
  options["num_predict"] = constraints.max_tokens;

  std::string system = constraints.system_prompt;
  if (!constraints.style_guide.empty()) {
    if (!system.empty()) {
      system += "\n\n";
    }
    system += constraints.style_guide;
  }

  try {
    ollama::request request(options_.generation_model, prompt, options, false);
    if (!system.empty()) {
      request["system"] = system;
    }
    ollama::response response = ollama::generate(request);

    GenerationResult result;
    result.text = response.as_simple_string();
    result.tool_call = ToolCallParser::parse_model_reply(result.text);
    return result;

  } catch (const ollama::exception &e) {
    throw GenerationUnavailableError("Generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw GenerationUnavailableError("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace localmind_core
