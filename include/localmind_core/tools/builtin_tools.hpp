#pragma once

#include <memory>
#include <string>
#include <vector>

#include "localmind_core/classify/keyword_classifier.hpp"
#include "localmind_core/classify/keyword_extractor.hpp"
#include "localmind_core/db/conversation_repo.hpp"
#include "localmind_core/index/knowledge_base.hpp"
#include "localmind_core/rag/retriever.hpp"
#include "localmind_core/tools/chat_exporter.hpp"
#include "localmind_core/tools/tool.hpp"
#include "localmind_core/tools/tool_registry.hpp"

namespace localmind_core {

class SearchDocumentsTool : public Tool {
 public:
  explicit SearchDocumentsTool(std::shared_ptr<Retriever> retriever);

  std::string name() const override { return "search_documents"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override;
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<Retriever> retriever_;
};

class SearchChatHistoryTool : public Tool {
 public:
  explicit SearchChatHistoryTool(std::shared_ptr<ConversationRepo> conversations);

  std::string name() const override { return "search_chat_history"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override;
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<ConversationRepo> conversations_;
};

class GetStatisticsTool : public Tool {
 public:
  GetStatisticsTool(std::shared_ptr<KnowledgeBase> knowledge_base,
                    std::shared_ptr<ConversationRepo> conversations);

  std::string name() const override { return "get_statistics"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override { return {}; }
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<KnowledgeBase> knowledge_base_;
  std::shared_ptr<ConversationRepo> conversations_;
};

// Dictionary categories merged with user-created ones.
class ListCategoriesTool : public Tool {
 public:
  ListCategoriesTool(std::shared_ptr<KeywordClassifier> classifier,
                     std::shared_ptr<ConversationRepo> conversations);

  std::string name() const override { return "list_categories"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override { return {}; }
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

  std::vector<CategoryInfo> all_categories() const;

 private:
  std::shared_ptr<KeywordClassifier> classifier_;
  std::shared_ptr<ConversationRepo> conversations_;
};

class ExportChatTool : public Tool {
 public:
  explicit ExportChatTool(std::shared_ptr<ChatExporter> exporter);

  std::string name() const override { return "export_chat"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override;
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<ChatExporter> exporter_;
};

class AnalyzeKeywordsTool : public Tool {
 public:
  AnalyzeKeywordsTool(std::shared_ptr<KeywordExtractor> extractor,
                      std::shared_ptr<KeywordClassifier> classifier);

  std::string name() const override { return "analyze_keywords"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override;
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<KeywordExtractor> extractor_;
  std::shared_ptr<KeywordClassifier> classifier_;
};

class CreateCategoryTool : public Tool {
 public:
  explicit CreateCategoryTool(std::shared_ptr<ConversationRepo> conversations);

  std::string name() const override { return "create_category"; }
  std::string description() const override;
  std::vector<ToolParameter> parameters() const override;
  ToolResult execute(const nlohmann::json& arguments, const ToolContext& context) override;

 private:
  std::shared_ptr<ConversationRepo> conversations_;
};

struct BuiltinToolDependencies {
  std::shared_ptr<Retriever> retriever;
  std::shared_ptr<KnowledgeBase> knowledge_base;
  std::shared_ptr<ConversationRepo> conversations;
  std::shared_ptr<KeywordClassifier> classifier;
  std::shared_ptr<KeywordExtractor> keyword_extractor;
  std::shared_ptr<ChatExporter> exporter;
};

void register_builtin_tools(ToolRegistry& registry, const BuiltinToolDependencies& deps);

}  // namespace localmind_core
