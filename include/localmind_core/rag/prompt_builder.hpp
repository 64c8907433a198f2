#pragma once

#include <string>
#include <vector>

#include "localmind_core/rag/retriever.hpp"
#include "localmind_core/tools/tool_registry.hpp"
#include "localmind_core/types/conversation.hpp"
#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

struct PromptBudget {
  // Code points shared by passages, tool results and history.
  size_t context_chars = 6000;
};

struct GroundingContext {
  // Best first.
  std::vector<ScoredChunk> chunks;
  std::vector<ToolCallRecord> tool_results;
  // Oldest first.
  std::vector<ConversationTurn> history;
};

struct BuiltPrompt {
  std::string prompt;
  std::vector<ChunkId> included_chunk_ids;
  size_t dropped_chunks = 0;
  size_t dropped_history = 0;
  bool tool_text_truncated = false;
  size_t context_chars = 0;
};

/**
 * @class PromptBuilder
 * @brief Assembles the grounded prompt within a character budget.
 *
 * When the context does not fit, the lowest-ranked passages go first, then
 * the oldest history turns, and finally the tool results are cut short.
 */
class PromptBuilder {
 public:
  explicit PromptBuilder(PromptBudget budget = {}, std::string response_language = "Korean");

  BuiltPrompt build(const std::string& query, const GroundingContext& context) const;

  // Persona, answer rules and the call syntax for every registered tool.
  std::string system_prompt(const ToolRegistry& registry) const;

  const PromptBudget& budget() const { return budget_; }

 private:
  PromptBudget budget_;
  std::string response_language_;
};

}  // namespace localmind_core
