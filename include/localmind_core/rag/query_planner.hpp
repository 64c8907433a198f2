#pragma once

#include <memory>
#include <string>
#include <vector>

#include "localmind_core/classify/keyword_extractor.hpp"
#include "localmind_core/tools/tool_registry.hpp"
#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

struct QueryPlan {
  bool retrieve = true;
  // Query text with inline tool calls removed; what gets embedded.
  std::string search_query;
  std::vector<ToolCallRequest> tool_calls;
};

/**
 * @class HeuristicPlanner
 * @brief Decides retrieval and tool calls without asking the model.
 *
 * Sources, in order: caller-supplied requests, inline @tool(...) calls in the
 * query, then keyword intents (statistics, categories, chat history,
 * export). Intents only map to registered tools and never duplicate a tool
 * already planned. A chat-history intent searches for the most frequent
 * keyword of the query that is not part of the intent phrase itself.
 */
class HeuristicPlanner {
 public:
  HeuristicPlanner(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<KeywordExtractor> extractor);

  // Throws InvalidArgumentError for a malformed inline call.
  QueryPlan plan(const std::string& query,
                 const std::vector<ToolCallRequest>& requested,
                 const std::string& conversation_id) const;

 private:
  void add_intent(QueryPlan& plan, ToolCallRequest request) const;
  std::string history_search_term(const std::string& query) const;

  std::shared_ptr<ToolRegistry> registry_;
  std::shared_ptr<KeywordExtractor> extractor_;
};

}  // namespace localmind_core
