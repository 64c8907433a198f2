#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  int http_threads;

  // Storage
  std::string db_path;
  std::string db_key;
  std::string index_path;
  std::string index_type;
  int hnsw_m;
  int hnsw_ef_construction;
  int hnsw_ef_search;

  // Ollama
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int embedding_dimension;
  float temperature;
  float top_p;
  int max_tokens;
  int embedding_timeout_seconds;
  int generation_timeout_seconds;

  int tool_timeout_seconds;
  int num_workers;

  // Ingestion
  int chunk_size;
  int chunk_overlap;
  int embedding_batch_size;
  long long max_file_size;

  // Retrieval and grounding
  int top_k;
  int max_top_k;
  int candidate_multiplier;
  float min_score;
  float category_boost;
  int context_budget_chars;
  int history_turns;
  int max_tool_iterations;

  std::string export_dir;
  std::string category_dictionary_path;
  std::string response_language;

  static constexpr const char* kDbKeyEnv = "LOCALMIND_DB_KEY";

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.http_threads = json_config.value("http_threads", 4);

      config.db_path = json_config.value("db_path", std::string("./data/localmind.db"));
      config.db_key = json_config.value("db_key", std::string());
      config.index_path = json_config.value("index_path", std::string("./data/localmind.faiss"));
      config.index_type = json_config.value("index_type", std::string("flat"));
      config.hnsw_m = json_config.value("hnsw_m", 32);
      config.hnsw_ef_construction = json_config.value("hnsw_ef_construction", 80);
      config.hnsw_ef_search = json_config.value("hnsw_ef_search", 64);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);
      config.temperature = json_config.value("temperature", 0.1f);
      config.top_p = json_config.value("top_p", 0.9f);
      config.max_tokens = json_config.value("max_tokens", 512);
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 30);
      config.generation_timeout_seconds = json_config.value("generation_timeout_seconds", 120);

      config.tool_timeout_seconds = json_config.value("tool_timeout_seconds", 30);
      config.num_workers = json_config.value("num_workers", 1);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 32);
      config.max_file_size = json_config.value("max_file_size", 100LL * 1024 * 1024);

      config.top_k = json_config.value("top_k", 5);
      config.max_top_k = json_config.value("max_top_k", 50);
      config.candidate_multiplier = json_config.value("candidate_multiplier", 4);
      config.min_score = json_config.value("min_score", 0.1f);
      config.category_boost = json_config.value("category_boost", 0.05f);
      config.context_budget_chars = json_config.value("context_budget_chars", 6000);
      config.history_turns = json_config.value("history_turns", 3);
      config.max_tool_iterations = json_config.value("max_tool_iterations", 3);

      config.export_dir = json_config.value("export_dir", std::string("./data/exports"));
      config.category_dictionary_path = json_config.value("category_dictionary_path", std::string());
      config.response_language = json_config.value("response_language", std::string("Korean"));
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    // The environment wins over a key written into the file.
    if (const char* env_key = std::getenv(kDbKeyEnv); env_key != nullptr && *env_key != '\0') {
      config.db_key = env_key;
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (http_threads <= 0) {
      throw std::runtime_error("http_threads must be greater than 0");
    }
    if (db_path.empty()) {
      throw std::runtime_error("db_path cannot be empty");
    }
    if (db_key.empty()) {
      throw std::runtime_error(std::string("db_key is not set; add it to the config or export ") + kDbKeyEnv);
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (index_type != "flat" && index_type != "hnsw") {
      throw std::runtime_error("index_type must be \"flat\" or \"hnsw\"");
    }
    if (hnsw_m <= 0 || hnsw_ef_construction <= 0 || hnsw_ef_search <= 0) {
      throw std::runtime_error("HNSW parameters must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (temperature < 0.0f || top_p <= 0.0f || top_p > 1.0f) {
      throw std::runtime_error("temperature must be >= 0 and top_p in (0, 1]");
    }
    if (max_tokens <= 0) {
      throw std::runtime_error("max_tokens must be greater than 0");
    }
    if (embedding_timeout_seconds <= 0 || generation_timeout_seconds <= 0 || tool_timeout_seconds <= 0) {
      throw std::runtime_error("timeouts must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (max_file_size <= 0) {
      throw std::runtime_error("max_file_size must be greater than 0");
    }
    if (top_k <= 0 || candidate_multiplier <= 0) {
      throw std::runtime_error("top_k and candidate_multiplier must be greater than 0");
    }
    if (max_top_k < top_k) {
      throw std::runtime_error("max_top_k cannot be smaller than top_k");
    }
    if (min_score < -1.0f || min_score > 1.0f) {
      throw std::runtime_error("min_score must be in [-1, 1]");
    }
    if (context_budget_chars <= 0) {
      throw std::runtime_error("context_budget_chars must be greater than 0");
    }
    if (history_turns < 0 || max_tool_iterations < 0) {
      throw std::runtime_error("history_turns and max_tool_iterations cannot be negative");
    }
    if (export_dir.empty()) {
      throw std::runtime_error("export_dir cannot be empty");
    }
    if (response_language.empty()) {
      throw std::runtime_error("response_language cannot be empty");
    }
  }
};
