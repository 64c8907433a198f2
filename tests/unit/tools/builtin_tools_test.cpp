#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "localmind_core/tools/builtin_tools.hpp"
#include "../../common/utilities_test.hpp"

namespace localmind_core {

class BuiltinToolsTest : public localmind_tests::KnowledgeBaseTestBase {
 protected:
  void SetUp() override {
    KnowledgeBaseTestBase::SetUp();
    export_dir_ = work_dir_ / "exports";

    BuiltinToolDependencies deps;
    deps.knowledge_base = knowledge_base_;
    deps.retriever = std::make_shared<Retriever>(knowledge_base_, embedder_, classifier_,
                                                 RetrievalOptions{.min_score = 0.0f});
    deps.conversations = conversation_repo_;
    deps.classifier = classifier_;
    deps.keyword_extractor = std::make_shared<KeywordExtractor>();
    deps.exporter = std::make_shared<ChatExporter>(conversation_repo_, export_dir_);
    register_builtin_tools(registry_, deps);
  }

  ToolCallRecord call(const std::string& name,
                      nlohmann::json arguments = nlohmann::json::object(),
                      const std::string& conversation_id = "") {
    ToolCallRequest request;
    request.name = name;
    request.arguments = std::move(arguments);
    ToolContext context;
    context.conversation_id = conversation_id;
    return registry_.invoke(request, context);
  }

  void ingest(const std::string& id, const std::string& text) {
    pipeline_->ingest(localmind_tests::TestUtilities::create_test_document(id, text));
  }

  ToolRegistry registry_;
  std::filesystem::path export_dir_;
};

TEST_F(BuiltinToolsTest, RegistersAllBuiltins) {
  EXPECT_EQ(registry_.names(),
            (std::vector<std::string>{"analyze_keywords", "create_category", "export_chat", "get_statistics",
                                      "list_categories", "search_chat_history", "search_documents"}));
}

TEST_F(BuiltinToolsTest, SearchDocuments_ReturnsRankedPassages) {
  ingest("solar", "Solar panels convert sunlight into electricity.");
  ingest("bread", "Sourdough bread needs a lively starter.");

  auto record = call("search_documents", {{"query", "solar panels sunlight"}, {"k", 1}});

  ASSERT_TRUE(record.success) << record.error;
  ASSERT_EQ(record.result["count"], 1);
  EXPECT_EQ(record.result["results"][0]["document_id"], "solar");
  EXPECT_FALSE(record.summary.empty());
}

TEST_F(BuiltinToolsTest, SearchDocuments_CategoryFilterIsHard) {
  ingest("tech", "서버 배포와 데이터베이스 튜닝 방법.");
  ingest("study", "시험 공부와 강의 복습 방법.");

  auto record = call("search_documents", {{"query", "방법"}, {"k", 5}, {"categories", "학습"}});

  ASSERT_TRUE(record.success) << record.error;
  ASSERT_EQ(record.result["count"], 1);
  EXPECT_EQ(record.result["results"][0]["document_id"], "study");
}

TEST_F(BuiltinToolsTest, SearchDocuments_NonPositiveKFails) {
  auto record = call("search_documents", {{"query", "x"}, {"k", 0}});
  EXPECT_FALSE(record.success);
  EXPECT_EQ(record.error_kind, "ToolFailure");
}

TEST_F(BuiltinToolsTest, SearchDocuments_HugeKIsClamped) {
  ingest("solar", "Solar panels convert sunlight into electricity.");

  auto record = call("search_documents", {{"query", "solar panels"}, {"k", 4000000000000000000LL}});

  ASSERT_TRUE(record.success) << record.error;
  EXPECT_EQ(record.result["count"], 1);
}

TEST_F(BuiltinToolsTest, SearchChatHistory_FindsEarlierTurns) {
  conversation_repo_->append_turn(
      localmind_tests::TestUtilities::create_test_turn("c1", "How do I deploy the server?", "Use the script."));
  conversation_repo_->append_turn(
      localmind_tests::TestUtilities::create_test_turn("c1", "What about lunch?", "Soup."));

  auto record = call("search_chat_history", {{"query", "DEPLOY"}});

  ASSERT_TRUE(record.success) << record.error;
  ASSERT_EQ(record.result["count"], 1);
  EXPECT_EQ(record.result["results"][0]["user_query"], "How do I deploy the server?");
}

TEST_F(BuiltinToolsTest, GetStatistics_CountsDocumentsAndConversations) {
  ingest("doc1", "First document.");
  ingest("doc2", "Second document.");
  conversation_repo_->append_turn(localmind_tests::TestUtilities::create_test_turn("c1", "q", "a", "기술"));

  auto record = call("get_statistics");

  ASSERT_TRUE(record.success) << record.error;
  EXPECT_EQ(record.result["documents"], 2);
  EXPECT_EQ(record.result["chunks"], 2);
  EXPECT_EQ(record.result["indexed_vectors"], 2);
  EXPECT_EQ(record.result["conversations"], 1);
  EXPECT_EQ(record.result["turns"], 1);
  EXPECT_EQ(record.result["turns_per_category"]["기술"], 1);
  EXPECT_EQ(record.result["index_type"], "flat");
}

TEST_F(BuiltinToolsTest, CreateAndListCategories) {
  auto created = call("create_category", {{"name", "여행"}, {"description", "Trips"}, {"color", "#ff0000"}});
  ASSERT_TRUE(created.success) << created.error;

  auto duplicate = call("create_category", {{"name", "여행"}});
  EXPECT_FALSE(duplicate.success);
  EXPECT_EQ(duplicate.error_kind, "InvalidArgument");

  auto listed = call("list_categories");
  ASSERT_TRUE(listed.success);
  const auto& categories = listed.result["categories"];
  ASSERT_EQ(categories.size(), 5u);

  bool found_user_category = false;
  for (const auto& category : categories) {
    if (category["name"] == "여행") {
      found_user_category = true;
      EXPECT_EQ(category["color"], "#ff0000");
      EXPECT_EQ(category["user_defined"], true);
    } else {
      EXPECT_EQ(category["user_defined"], false);
    }
  }
  EXPECT_TRUE(found_user_category);
}

TEST_F(BuiltinToolsTest, CreateCategory_CancelledCallWritesNothing) {
  auto tool = registry_.find("create_category");
  ASSERT_NE(tool, nullptr);
  ToolContext context;
  context.cancellation.cancel();

  EXPECT_THROW(tool->execute(tool->validate_arguments({{"name", "여행"}}), context), CancelledError);

  auto listed = call("list_categories");
  ASSERT_TRUE(listed.success);
  for (const auto& category : listed.result["categories"]) {
    EXPECT_NE(category["name"], "여행");
  }
}

TEST_F(BuiltinToolsTest, ExportChat_CancelledCallWritesNoFile) {
  const std::string conversation_id = conversation_repo_->create_conversation("Deploy notes");
  conversation_repo_->append_turn(
      localmind_tests::TestUtilities::create_test_turn(conversation_id, "How to deploy?", "Run make deploy."));
  auto tool = registry_.find("export_chat");
  ASSERT_NE(tool, nullptr);
  ToolContext context;
  context.conversation_id = conversation_id;
  context.cancellation.cancel();

  EXPECT_THROW(tool->execute(tool->validate_arguments({{"format", "md"}}), context), CancelledError);
  EXPECT_FALSE(std::filesystem::exists(export_dir_));
}

TEST_F(BuiltinToolsTest, ExportChat_DefaultsToCurrentConversation) {
  const std::string conversation_id = conversation_repo_->create_conversation("Deploy notes");
  conversation_repo_->append_turn(
      localmind_tests::TestUtilities::create_test_turn(conversation_id, "How to deploy?", "Run make deploy."));

  auto record = call("export_chat", {{"format", "json"}}, conversation_id);

  ASSERT_TRUE(record.success) << record.error;
  const std::filesystem::path path = record.result["path"].get<std::string>();
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(path.parent_path(), export_dir_);
  EXPECT_EQ(path.extension(), ".json");
  EXPECT_EQ(record.result["turns"], 1);
}

TEST_F(BuiltinToolsTest, ExportChat_Failures) {
  auto no_conversation = call("export_chat");
  EXPECT_FALSE(no_conversation.success);
  EXPECT_EQ(no_conversation.error_kind, "ToolFailure");

  auto bad_format = call("export_chat", {{"conversation_id", "abc"}, {"format", "pdf"}});
  EXPECT_FALSE(bad_format.success);
  EXPECT_EQ(bad_format.error_kind, "InvalidArgument");

  auto unknown = call("export_chat", {{"conversation_id", "missing"}});
  EXPECT_FALSE(unknown.success);
  EXPECT_EQ(unknown.error_kind, "InvalidArgument");
}

TEST_F(BuiltinToolsTest, AnalyzeKeywords_ReturnsKeywordsAndCategory) {
  auto record = call("analyze_keywords",
                     {{"text", "서버 배포 서버 점검 서버 로그 분석"}, {"max_keywords", 2}});

  ASSERT_TRUE(record.success) << record.error;
  ASSERT_EQ(record.result["keywords"].size(), 2u);
  EXPECT_EQ(record.result["keywords"][0], "서버");
  EXPECT_EQ(record.result["category"], "기술");
}

}  // namespace localmind_core
