#include "localmind_core/rag/prompt_builder.hpp"

#include <iomanip>
#include <sstream>

#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

std::string render_chunk(size_t rank, const ScoredChunk& scored) {
  std::stringstream ss;
  ss << "[" << rank << "] (source: " << scored.chunk.document_id << " #" << scored.chunk.chunk_index
     << ", score " << std::fixed << std::setprecision(3) << scored.score << ")\n"
     << scored.chunk.content << "\n\n";
  return ss.str();
}

std::string render_tool(const ToolCallRecord& record) {
  std::stringstream ss;
  ss << "- " << record.name << "(" << record.arguments.dump() << "): ";
  if (record.success) {
    ss << record.summary << "\n" << record.result.dump() << "\n";
  } else {
    ss << "failed (" << record.error_kind << "): " << record.error << "\n";
  }
  return ss.str();
}

std::string render_turn(const ConversationTurn& turn) {
  return "User: " + turn.user_query + "\nAssistant: " + turn.response + "\n\n";
}

size_t total_chars(const std::vector<std::string>& parts) {
  size_t total = 0;
  for (const auto& part : parts) {
    total += text::char_count(part);
  }
  return total;
}

}  // namespace

PromptBuilder::PromptBuilder(PromptBudget budget, std::string response_language)
    : budget_(budget), response_language_(std::move(response_language)) {}

BuiltPrompt PromptBuilder::build(const std::string& query, const GroundingContext& context) const {
  BuiltPrompt built;

  std::vector<std::string> chunk_parts;
  for (size_t i = 0; i < context.chunks.size(); ++i) {
    chunk_parts.push_back(render_chunk(i + 1, context.chunks[i]));
  }
  std::string tool_text;
  for (const auto& record : context.tool_results) {
    tool_text += render_tool(record);
  }
  std::vector<std::string> history_parts;
  for (const auto& turn : context.history) {
    history_parts.push_back(render_turn(turn));
  }
  size_t history_begin = 0;

  auto used = [&]() {
    size_t history = 0;
    for (size_t i = history_begin; i < history_parts.size(); ++i) {
      history += text::char_count(history_parts[i]);
    }
    return total_chars(chunk_parts) + text::char_count(tool_text) + history;
  };

  while (used() > budget_.context_chars && !chunk_parts.empty()) {
    chunk_parts.pop_back();
    ++built.dropped_chunks;
  }
  while (used() > budget_.context_chars && history_begin < history_parts.size()) {
    ++history_begin;
    ++built.dropped_history;
  }
  if (used() > budget_.context_chars) {
    const size_t fixed = used() - text::char_count(tool_text);
    const size_t room = budget_.context_chars > fixed ? budget_.context_chars - fixed : 0;
    tool_text = text::truncate_chars(tool_text, room);
    built.tool_text_truncated = true;
  }
  built.context_chars = used();

  for (size_t i = 0; i < chunk_parts.size(); ++i) {
    built.included_chunk_ids.push_back(context.chunks[i].chunk.id);
  }

  std::stringstream ss;
  ss << "Answer the question using the context below. Cite passages by their [number]. "
     << "If the context does not contain the answer, say so. Respond in " << response_language_ << ".\n\n";
  if (!chunk_parts.empty()) {
    ss << "## Documents\n";
    for (const auto& part : chunk_parts) {
      ss << part;
    }
  }
  if (!tool_text.empty()) {
    ss << "## Tool results\n" << tool_text << "\n";
  }
  if (history_begin < history_parts.size()) {
    ss << "## Conversation so far\n";
    for (size_t i = history_begin; i < history_parts.size(); ++i) {
      ss << history_parts[i];
    }
  }
  ss << "## Question\n" << query << "\n";
  built.prompt = ss.str();
  return built;
}

std::string PromptBuilder::system_prompt(const ToolRegistry& registry) const {
  std::stringstream ss;
  ss << "You are LocalMind, an assistant that answers from the user's own documents. "
     << "Ground every statement in the provided context and respond in " << response_language_ << ".\n";

  const auto tools = registry.describe_all();
  if (!tools.empty()) {
    ss << "\nIf you need a tool, reply with a single line of the form @tool_name(key=value, ...) "
       << "and nothing else. Available tools:\n";
    for (const auto& tool : tools) {
      ss << "- " << tool["name"].get<std::string>() << ": " << tool["description"].get<std::string>();
      const auto& params = tool["parameters"];
      if (!params.empty()) {
        ss << " Parameters:";
        for (const auto& param : params) {
          ss << " " << param["name"].get<std::string>() << " (" << param["type"].get<std::string>()
             << (param["required"].get<bool>() ? ", required" : "") << ")";
        }
      }
      ss << "\n";
    }
  }
  return ss.str();
}

}  // namespace localmind_core
