#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/llm/embedding_port.hpp"

namespace localmind_core {

struct RetrievalOptions {
  size_t top_k = 5;
  // Larger requested k values are clamped to this.
  size_t max_top_k = 50;
  // Candidate pool = top_k * candidate_multiplier.
  size_t candidate_multiplier = 4;
  float min_score = 0.1f;
  float category_boost = 0.05f;
};

struct RetrievalRequest {
  std::string query;
  // 0 uses RetrievalOptions::top_k; values above max_top_k are clamped.
  size_t top_k = 0;
  // Overrides the categories classified from the query when non-empty.
  std::set<std::string> categories;
  // Drop chunks sharing no category with the query instead of just ranking
  // them lower.
  bool category_scoped = false;
  std::optional<float> min_score;
};

struct ScoredChunk {
  Chunk chunk;
  // Cosine similarity from the index.
  float score = 0.0f;
  // score plus the category boost, used for ordering.
  float adjusted_score = 0.0f;
  bool category_match = false;
};

struct RetrievalOutcome {
  std::set<std::string> query_categories;
  std::vector<ScoredChunk> chunks;
};

class Retriever {
 public:
  Retriever(std::shared_ptr<KnowledgeBase> knowledge_base,
            std::shared_ptr<EmbeddingPort> embedder,
            std::shared_ptr<KeywordClassifier> classifier,
            RetrievalOptions options = {});

  // Embeds the query once, searches, hydrates and re-ranks. Ordered by
  // adjusted score descending, ties by chunk id ascending.
  RetrievalOutcome retrieve(const RetrievalRequest& request) const;

  const RetrievalOptions& options() const { return options_; }

 private:
  std::shared_ptr<KnowledgeBase> knowledge_base_;
  std::shared_ptr<EmbeddingPort> embedder_;
  std::shared_ptr<KeywordClassifier> classifier_;
  RetrievalOptions options_;
};

}  // namespace localmind_core
