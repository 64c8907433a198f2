#include "localmind_core/tools/builtin_tools.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/errors.hpp"

namespace localmind_core {

namespace {

nlohmann::json turn_to_json(const ConversationTurn& turn) {
  return {{"turn_id", turn.id},
          {"conversation_id", turn.conversation_id},
          {"user_query", turn.user_query},
          {"response", turn.response},
          {"category", turn.category},
          {"keywords", turn.keywords},
          {"created_at", time_point_to_string(turn.created_at)}};
}

}  // namespace

// ---------------------------------------------------------------------------
// search_documents
// ---------------------------------------------------------------------------

SearchDocumentsTool::SearchDocumentsTool(std::shared_ptr<Retriever> retriever)
    : retriever_(std::move(retriever)) {}

std::string SearchDocumentsTool::description() const {
  return "Searches the indexed documents for passages relevant to a query.";
}

std::vector<ToolParameter> SearchDocumentsTool::parameters() const {
  return {
      {"query", ParameterType::String, "Text to search for", true, nullptr},
      {"k", ParameterType::Integer, "Maximum number of passages", false, 5},
      {"categories", ParameterType::StringList, "Only return passages tagged with these categories", false,
       nullptr},
  };
}

ToolResult SearchDocumentsTool::execute(const nlohmann::json& arguments, const ToolContext& context) {
  const long long k = arguments.at("k").get<long long>();
  if (k <= 0) {
    return ToolResult::failure("k must be positive");
  }

  RetrievalRequest request;
  request.query = arguments.at("query").get<std::string>();
  request.top_k = std::min(static_cast<size_t>(k), retriever_->options().max_top_k);
  if (arguments.contains("categories")) {
    for (const auto& category : arguments.at("categories")) {
      request.categories.insert(category.get<std::string>());
    }
    request.category_scoped = !request.categories.empty();
  }

  context.cancellation.throw_if_cancelled("search_documents");
  RetrievalOutcome outcome = retriever_->retrieve(request);

  nlohmann::json results = nlohmann::json::array();
  for (const auto& scored : outcome.chunks) {
    results.push_back({{"chunk_id", scored.chunk.id},
                       {"document_id", scored.chunk.document_id},
                       {"chunk_index", scored.chunk.chunk_index},
                       {"score", scored.score},
                       {"categories", scored.chunk.categories},
                       {"content", scored.chunk.content}});
  }
  return ToolResult::ok({{"results", results}, {"count", results.size()}},
                        "Found " + std::to_string(results.size()) + " passages for '" + request.query + "'");
}

// ---------------------------------------------------------------------------
// search_chat_history
// ---------------------------------------------------------------------------

SearchChatHistoryTool::SearchChatHistoryTool(std::shared_ptr<ConversationRepo> conversations)
    : conversations_(std::move(conversations)) {}

std::string SearchChatHistoryTool::description() const {
  return "Searches earlier conversation turns for a keyword or phrase.";
}

std::vector<ToolParameter> SearchChatHistoryTool::parameters() const {
  return {
      {"query", ParameterType::String, "Keyword or phrase to look for", true, nullptr},
      {"k", ParameterType::Integer, "Maximum number of turns", false, 10},
      {"category", ParameterType::String, "Only turns in this category", false, nullptr},
  };
}

ToolResult SearchChatHistoryTool::execute(const nlohmann::json& arguments, const ToolContext&) {
  const long long k = arguments.at("k").get<long long>();
  if (k <= 0) {
    return ToolResult::failure("k must be positive");
  }
  const std::string query = arguments.at("query").get<std::string>();
  const std::string category = arguments.value("category", std::string());

  nlohmann::json results = nlohmann::json::array();
  for (const auto& turn : conversations_->search_turns(query, static_cast<size_t>(k), category)) {
    results.push_back(turn_to_json(turn));
  }
  return ToolResult::ok({{"results", results}, {"count", results.size()}},
                        "Found " + std::to_string(results.size()) + " earlier turns matching '" + query + "'");
}

// ---------------------------------------------------------------------------
// get_statistics
// ---------------------------------------------------------------------------

GetStatisticsTool::GetStatisticsTool(std::shared_ptr<KnowledgeBase> knowledge_base,
                                     std::shared_ptr<ConversationRepo> conversations)
    : knowledge_base_(std::move(knowledge_base)), conversations_(std::move(conversations)) {}

std::string GetStatisticsTool::description() const {
  return "Reports document, chunk and conversation statistics.";
}

ToolResult GetStatisticsTool::execute(const nlohmann::json&, const ToolContext&) {
  const KnowledgeBaseStats kb = knowledge_base_->stats();
  const ConversationStatistics chat = conversations_->statistics();

  nlohmann::json per_category = nlohmann::json::object();
  for (const auto& [category, count] : chat.turns_per_category) {
    per_category[category.empty() ? "uncategorized" : category] = count;
  }

  nlohmann::json data = {{"documents", kb.document_count},
                         {"chunks", kb.chunk_count},
                         {"indexed_vectors", kb.indexed_vectors},
                         {"chunk_categories", kb.category_counts},
                         {"snapshot_version", kb.snapshot_version},
                         {"index_type", kb.index_type},
                         {"conversations", chat.conversation_count},
                         {"turns", chat.turn_count},
                         {"turns_per_category", per_category}};
  return ToolResult::ok(data, std::to_string(kb.document_count) + " documents, " +
                                  std::to_string(kb.chunk_count) + " chunks, " +
                                  std::to_string(chat.conversation_count) + " conversations");
}

// ---------------------------------------------------------------------------
// list_categories
// ---------------------------------------------------------------------------

ListCategoriesTool::ListCategoriesTool(std::shared_ptr<KeywordClassifier> classifier,
                                       std::shared_ptr<ConversationRepo> conversations)
    : classifier_(std::move(classifier)), conversations_(std::move(conversations)) {}

std::string ListCategoriesTool::description() const {
  return "Lists dictionary categories and user-created categories.";
}

std::vector<CategoryInfo> ListCategoriesTool::all_categories() const {
  std::map<std::string, CategoryInfo> merged;
  for (const auto& name : classifier_->categories()) {
    merged[name] = {name, "", "#007bff", false};
  }
  // A user category with a dictionary name keeps its description and color.
  for (auto& category : conversations_->list_user_categories()) {
    merged[category.name] = category;
  }

  std::vector<CategoryInfo> out;
  for (auto& [name, info] : merged) {
    out.push_back(std::move(info));
  }
  return out;
}

ToolResult ListCategoriesTool::execute(const nlohmann::json&, const ToolContext&) {
  nlohmann::json categories = nlohmann::json::array();
  const auto all = all_categories();
  for (const auto& category : all) {
    categories.push_back({{"name", category.name},
                          {"description", category.description},
                          {"color", category.color},
                          {"user_defined", category.user_defined}});
  }
  return ToolResult::ok({{"categories", categories}}, std::to_string(all.size()) + " categories");
}

// ---------------------------------------------------------------------------
// export_chat
// ---------------------------------------------------------------------------

ExportChatTool::ExportChatTool(std::shared_ptr<ChatExporter> exporter) : exporter_(std::move(exporter)) {}

std::string ExportChatTool::description() const {
  return "Exports a conversation to a json, txt or md file.";
}

std::vector<ToolParameter> ExportChatTool::parameters() const {
  return {
      {"conversation_id", ParameterType::String, "Conversation to export; defaults to the current one", false,
       nullptr},
      {"format", ParameterType::String, "json, txt or md", false, "md"},
  };
}

ToolResult ExportChatTool::execute(const nlohmann::json& arguments, const ToolContext& context) {
  const std::string conversation_id = arguments.value("conversation_id", context.conversation_id);
  if (conversation_id.empty()) {
    return ToolResult::failure("No conversation to export");
  }
  const std::string format = arguments.at("format").get<std::string>();
  if (!ChatExporter::is_supported_format(format)) {
    throw InvalidArgumentError("Unsupported export format: " + format + " (expected json, txt or md)");
  }

  ExportResult exported = exporter_->export_conversation(conversation_id, format, context.cancellation);
  return ToolResult::ok({{"filename", exported.filename},
                         {"path", exported.path.string()},
                         {"turns", exported.turn_count}},
                        "Conversation exported to " + exported.filename);
}

// ---------------------------------------------------------------------------
// analyze_keywords
// ---------------------------------------------------------------------------

AnalyzeKeywordsTool::AnalyzeKeywordsTool(std::shared_ptr<KeywordExtractor> extractor,
                                         std::shared_ptr<KeywordClassifier> classifier)
    : extractor_(std::move(extractor)), classifier_(std::move(classifier)) {}

std::string AnalyzeKeywordsTool::description() const {
  return "Extracts frequent keywords from text and recommends a category.";
}

std::vector<ToolParameter> AnalyzeKeywordsTool::parameters() const {
  return {
      {"text", ParameterType::String, "Text to analyse", true, nullptr},
      {"max_keywords", ParameterType::Integer, "Maximum number of keywords", false,
       static_cast<int>(KeywordExtractor::kDefaultMaxKeywords)},
  };
}

ToolResult AnalyzeKeywordsTool::execute(const nlohmann::json& arguments, const ToolContext&) {
  const long long max_keywords = arguments.at("max_keywords").get<long long>();
  if (max_keywords <= 0) {
    return ToolResult::failure("max_keywords must be positive");
  }
  const std::string text = arguments.at("text").get<std::string>();

  const auto keywords = extractor_->extract(text, static_cast<size_t>(max_keywords));
  const std::string category = classifier_->primary_category(text);
  return ToolResult::ok({{"keywords", keywords}, {"category", category}},
                        std::to_string(keywords.size()) + " keywords, category " + category);
}

// ---------------------------------------------------------------------------
// create_category
// ---------------------------------------------------------------------------

CreateCategoryTool::CreateCategoryTool(std::shared_ptr<ConversationRepo> conversations)
    : conversations_(std::move(conversations)) {}

std::string CreateCategoryTool::description() const {
  return "Creates a user-defined conversation category.";
}

std::vector<ToolParameter> CreateCategoryTool::parameters() const {
  return {
      {"name", ParameterType::String, "Category name", true, nullptr},
      {"description", ParameterType::String, "What the category is for", false, ""},
      {"color", ParameterType::String, "Display color", false, "#007bff"},
  };
}

ToolResult CreateCategoryTool::execute(const nlohmann::json& arguments, const ToolContext& context) {
  CategoryInfo category;
  category.name = arguments.at("name").get<std::string>();
  category.description = arguments.at("description").get<std::string>();
  category.color = arguments.at("color").get<std::string>();
  category.user_defined = true;

  context.cancellation.throw_if_cancelled("create_category");
  conversations_->create_category(category);
  return ToolResult::ok({{"name", category.name}, {"color", category.color}},
                        "Category '" + category.name + "' created");
}

// ---------------------------------------------------------------------------

void register_builtin_tools(ToolRegistry& registry, const BuiltinToolDependencies& deps) {
  registry.register_tool(std::make_shared<SearchDocumentsTool>(deps.retriever));
  registry.register_tool(std::make_shared<SearchChatHistoryTool>(deps.conversations));
  registry.register_tool(std::make_shared<GetStatisticsTool>(deps.knowledge_base, deps.conversations));
  registry.register_tool(std::make_shared<ListCategoriesTool>(deps.classifier, deps.conversations));
  registry.register_tool(std::make_shared<ExportChatTool>(deps.exporter));
  registry.register_tool(std::make_shared<AnalyzeKeywordsTool>(deps.keyword_extractor, deps.classifier));
  registry.register_tool(std::make_shared<CreateCategoryTool>(deps.conversations));
}

}  // namespace localmind_core
