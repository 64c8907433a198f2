#include "localmind_core/rag/retriever.hpp"

#include <algorithm>
#include <limits>

#include "localmind_core/errors.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

Retriever::Retriever(std::shared_ptr<KnowledgeBase> knowledge_base,
                     std::shared_ptr<EmbeddingPort> embedder,
                     std::shared_ptr<KeywordClassifier> classifier,
                     RetrievalOptions options)
    : knowledge_base_(std::move(knowledge_base)),
      embedder_(std::move(embedder)),
      classifier_(std::move(classifier)),
      options_(options) {
  if (options_.top_k == 0) {
    throw InvalidArgumentError("top_k must be positive");
  }
  if (options_.candidate_multiplier == 0) {
    throw InvalidArgumentError("candidate_multiplier must be positive");
  }
  if (options_.max_top_k < options_.top_k) {
    throw InvalidArgumentError("max_top_k cannot be smaller than top_k");
  }
  if (options_.candidate_multiplier > std::numeric_limits<size_t>::max() / options_.max_top_k) {
    throw InvalidArgumentError("max_top_k * candidate_multiplier overflows");
  }
}

RetrievalOutcome Retriever::retrieve(const RetrievalRequest& request) const {
  if (text::is_blank(request.query)) {
    throw InvalidArgumentError("Search query must not be empty");
  }

  RetrievalOutcome outcome;
  outcome.query_categories =
      request.categories.empty() ? classifier_->classify(request.query) : request.categories;

  const size_t k = std::min(request.top_k > 0 ? request.top_k : options_.top_k, options_.max_top_k);
  const size_t candidates = k * options_.candidate_multiplier;
  const float min_score = request.min_score.value_or(options_.min_score);
  const bool hard_filter = request.category_scoped && !outcome.query_categories.empty();

  const std::vector<float> query_vector = embedder_->get_embedding(request.query);
  if (query_vector.size() != knowledge_base_->dimension()) {
    throw EmbeddingUnavailableError("Query embedding has dimension " + std::to_string(query_vector.size()) +
                                    ", index expects " + std::to_string(knowledge_base_->dimension()));
  }

  for (auto& hit : knowledge_base_->retrieve(query_vector, candidates, candidates)) {
    if (hit.score < min_score) {
      continue;
    }
    ScoredChunk scored;
    scored.score = hit.score;
    scored.category_match = std::any_of(hit.chunk.categories.begin(), hit.chunk.categories.end(),
                                        [&](const std::string& category) {
                                          return outcome.query_categories.count(category) > 0;
                                        });
    if (hard_filter && !scored.category_match) {
      continue;
    }
    scored.adjusted_score = hit.score + (scored.category_match ? options_.category_boost : 0.0f);
    scored.chunk = std::move(hit.chunk);
    outcome.chunks.push_back(std::move(scored));
  }

  std::sort(outcome.chunks.begin(), outcome.chunks.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
    if (a.adjusted_score != b.adjusted_score) {
      return a.adjusted_score > b.adjusted_score;
    }
    return a.chunk.id < b.chunk.id;
  });
  if (outcome.chunks.size() > k) {
    outcome.chunks.resize(k);
  }
  return outcome;
}

}  // namespace localmind_core
