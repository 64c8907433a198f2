#include "localmind_core/rag/query_planner.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>

#include "localmind_core/llm/tool_call_parser.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

bool mentions_any(const std::string& lowered, std::initializer_list<const char*> phrases) {
  for (const char* phrase : phrases) {
    if (lowered.find(phrase) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

HeuristicPlanner::HeuristicPlanner(std::shared_ptr<ToolRegistry> registry,
                                   std::shared_ptr<KeywordExtractor> extractor)
    : registry_(std::move(registry)), extractor_(std::move(extractor)) {}

std::string HeuristicPlanner::history_search_term(const std::string& query) const {
  static const std::set<std::string> kIntentWords = {"chat",  "history", "previous", "earlier", "conversation",
                                                     "이전",  "지난",    "대화",     "기록",    "대화에서",
                                                     "기록에서"};
  for (const auto& keyword : extractor_->extract(query, 20)) {
    if (kIntentWords.count(text::to_lower_ascii(keyword)) == 0) {
      return keyword;
    }
  }
  return query;
}

void HeuristicPlanner::add_intent(QueryPlan& plan, ToolCallRequest request) const {
  if (!registry_->contains(request.name)) {
    return;
  }
  const bool planned = std::any_of(plan.tool_calls.begin(), plan.tool_calls.end(),
                                   [&](const ToolCallRequest& r) { return r.name == request.name; });
  if (!planned) {
    plan.tool_calls.push_back(std::move(request));
  }
}

QueryPlan HeuristicPlanner::plan(const std::string& query,
                                 const std::vector<ToolCallRequest>& requested,
                                 const std::string& conversation_id) const {
  QueryPlan plan;
  plan.tool_calls = requested;
  for (auto& call : ToolCallParser::parse_inline_calls(query)) {
    plan.tool_calls.push_back(std::move(call));
  }

  plan.search_query = ToolCallParser::strip_inline_calls(query);
  plan.retrieve = !text::is_blank(plan.search_query);

  const std::string lowered = text::to_lower_ascii(plan.search_query);
  if (lowered.empty()) {
    return plan;
  }

  if (mentions_any(lowered, {"statistics", "stats", "통계"})) {
    add_intent(plan, {"get_statistics", nlohmann::json::object(), false});
  }
  if (mentions_any(lowered, {"categories", "list category", "카테고리 목록", "분류 목록"})) {
    add_intent(plan, {"list_categories", nlohmann::json::object(), false});
  }
  if (mentions_any(lowered, {"chat history", "previous conversation", "earlier conversation", "이전 대화",
                             "지난 대화", "대화 기록"})) {
    add_intent(plan,
               {"search_chat_history", {{"query", history_search_term(plan.search_query)}, {"k", 5}}, false});
  }
  if (!conversation_id.empty() && mentions_any(lowered, {"export", "내보내"})) {
    std::string format = "md";
    if (mentions_any(lowered, {"json"})) {
      format = "json";
    } else if (mentions_any(lowered, {"txt", "text file"})) {
      format = "txt";
    }
    add_intent(plan, {"export_chat", {{"conversation_id", conversation_id}, {"format", format}}, false});
  }
  return plan;
}

}  // namespace localmind_core
