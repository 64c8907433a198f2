#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/classify/keyword_extractor.hpp"
#include "localmind_core/db/conversation_store.hpp"
#include "localmind_core/errors.hpp"
#include "localmind_core/llm/generation_port.hpp"
#include "localmind_core/rag/cancellation.hpp"
#include "localmind_core/rag/prompt_builder.hpp"
#include "localmind_core/rag/query_planner.hpp"
#include "localmind_core/rag/retriever.hpp"
#include "localmind_core/rag/style_analyzer.hpp"
#include "localmind_core/tools/tool_registry.hpp"

namespace localmind_core {

enum class TurnState { Received, Planning, Retrieving, ToolDispatch, Grounding, Generating, Completed, Failed };

std::string to_string(TurnState state);

struct TurnRequest {
  std::string conversation_id;
  std::string query;
  std::vector<ToolCallRequest> tool_requests;

  bool retrieve = true;
  size_t top_k = 0;
  std::set<std::string> categories;
  bool category_scoped = false;
  std::optional<float> min_score;

  // Style-mimicking mode. Without an exemplar, the retrieved passages are
  // used as one.
  bool style_mode = false;
  std::string style_exemplar;

  bool persist = true;
  CancellationToken cancellation;
};

struct Provenance {
  ChunkId chunk_id = 0;
  std::string document_id;
  int chunk_index = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  float score = 0.0f;
};

struct TurnOutcome {
  TurnState state = TurnState::Received;
  std::string answer;
  std::vector<Provenance> provenance;
  std::vector<ToolCallRecord> tool_calls;
  std::optional<ErrorKind> error_kind;
  std::string error_message;
  std::vector<TurnState> transitions;
  // What had been gathered when the turn failed.
  nlohmann::json partial_context = nlohmann::json::object();
  long long turn_id = 0;
  std::string category;
  std::vector<std::string> keywords;
  std::optional<StyleProfile> style;

  bool ok() const { return state == TurnState::Completed; }
  nlohmann::json to_json() const;
};

struct OrchestratorOptions {
  size_t max_tool_iterations = 3;
  size_t history_turns = 3;
  GenerationConstraints generation;
};

struct OrchestratorComponents {
  std::shared_ptr<Retriever> retriever;
  std::shared_ptr<ToolRegistry> tools;
  std::shared_ptr<GenerationPort> generator;
  std::shared_ptr<ConversationStore> conversations;
  std::shared_ptr<KeywordClassifier> classifier;
  std::shared_ptr<KeywordExtractor> keyword_extractor;
  std::shared_ptr<HeuristicPlanner> planner;
  std::shared_ptr<PromptBuilder> prompt_builder;
  std::shared_ptr<StyleAnalyzer> style_analyzer;
};

/**
 * @class RagOrchestrator
 * @brief Runs one query through plan -> retrieve -> tools -> ground -> generate.
 *
 *   Received -> Planning -> Retrieving -> (ToolDispatch)* -> Grounding
 *            -> Generating -> Completed
 *
 * Failed is reachable from every non-terminal state. A model reply asking
 * for a tool loops back to ToolDispatch at most max_tool_iterations times.
 * The cancellation token is checked before every transition.
 *
 * run() does not throw for query-time failures; the outcome carries the
 * error kind, the message and whatever context had been gathered.
 */
class RagOrchestrator {
 public:
  RagOrchestrator(OrchestratorComponents components, OrchestratorOptions options = {});

  TurnOutcome run(const TurnRequest& request) const;

  const OrchestratorOptions& options() const { return options_; }

 private:
  void transition(TurnOutcome& outcome, TurnState next, const CancellationToken& token) const;
  void dispatch(std::vector<ToolCallRequest>& pending, TurnOutcome& outcome, const TurnRequest& request) const;

  OrchestratorComponents components_;
  OrchestratorOptions options_;
};

}  // namespace localmind_core
