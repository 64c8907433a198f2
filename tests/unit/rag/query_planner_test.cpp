#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "localmind_core/errors.hpp"
#include "localmind_core/rag/query_planner.hpp"
#include "../../common/mocks_test.hpp"

namespace localmind_core {

class QueryPlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<ToolRegistry>();
    for (const char* name : {"get_statistics", "list_categories", "search_chat_history", "export_chat", "echo"}) {
      registry_->register_tool(std::make_shared<localmind_tests::MockTool>(name));
    }
    planner_ = std::make_unique<HeuristicPlanner>(registry_, std::make_shared<KeywordExtractor>());
  }

  std::shared_ptr<ToolRegistry> registry_;
  std::unique_ptr<HeuristicPlanner> planner_;
};

TEST_F(QueryPlannerTest, PlainQueryOnlyRetrieves) {
  auto plan = planner_->plan("How do solar panels work?", {}, "c1");

  EXPECT_TRUE(plan.retrieve);
  EXPECT_EQ(plan.search_query, "How do solar panels work?");
  EXPECT_TRUE(plan.tool_calls.empty());
}

TEST_F(QueryPlannerTest, InlineCallsAreStrippedFromSearchQuery) {
  auto plan = planner_->plan("@echo(text=\"hi\") what did it say?", {}, "");

  ASSERT_EQ(plan.tool_calls.size(), 1u);
  EXPECT_EQ(plan.tool_calls[0].name, "echo");
  EXPECT_EQ(plan.tool_calls[0].arguments["text"], "hi");
  EXPECT_EQ(plan.search_query, "what did it say?");
  EXPECT_TRUE(plan.retrieve);
}

TEST_F(QueryPlannerTest, QueryOfOnlyCallsSkipsRetrieval) {
  auto plan = planner_->plan("@get_statistics()", {}, "");
  EXPECT_FALSE(plan.retrieve);
  ASSERT_EQ(plan.tool_calls.size(), 1u);
}

TEST_F(QueryPlannerTest, RequestedCallsComeFirstAndAreNotDuplicated) {
  ToolCallRequest requested{"get_statistics", nlohmann::json::object(), true};

  auto plan = planner_->plan("show me the stats", {requested}, "");

  ASSERT_EQ(plan.tool_calls.size(), 1u);
  EXPECT_EQ(plan.tool_calls[0].name, "get_statistics");
  EXPECT_TRUE(plan.tool_calls[0].required);
}

TEST_F(QueryPlannerTest, KeywordIntents) {
  auto stats = planner_->plan("문서 통계 알려줘", {}, "");
  ASSERT_EQ(stats.tool_calls.size(), 1u);
  EXPECT_EQ(stats.tool_calls[0].name, "get_statistics");

  auto categories = planner_->plan("What categories exist?", {}, "");
  ASSERT_EQ(categories.tool_calls.size(), 1u);
  EXPECT_EQ(categories.tool_calls[0].name, "list_categories");
}

TEST_F(QueryPlannerTest, ChatHistoryIntentSearchesForTopicKeyword) {
  auto korean = planner_->plan("이전 대화에서 배포 이야기 찾아줘", {}, "");
  ASSERT_EQ(korean.tool_calls.size(), 1u);
  EXPECT_EQ(korean.tool_calls[0].name, "search_chat_history");
  EXPECT_EQ(korean.tool_calls[0].arguments["query"], "배포");
  EXPECT_EQ(korean.tool_calls[0].arguments["k"], 5);

  auto english = planner_->plan("chat history about deployment and deployment scripts", {}, "");
  ASSERT_EQ(english.tool_calls.size(), 1u);
  EXPECT_EQ(english.tool_calls[0].arguments["query"], "deployment");
}

TEST_F(QueryPlannerTest, ExportIntentNeedsConversation) {
  EXPECT_TRUE(planner_->plan("export this as json", {}, "").tool_calls.empty());

  auto plan = planner_->plan("export this as json", {}, "conv42");
  ASSERT_EQ(plan.tool_calls.size(), 1u);
  EXPECT_EQ(plan.tool_calls[0].name, "export_chat");
  EXPECT_EQ(plan.tool_calls[0].arguments["conversation_id"], "conv42");
  EXPECT_EQ(plan.tool_calls[0].arguments["format"], "json");

  auto markdown = planner_->plan("대화 내보내기", {}, "conv42");
  ASSERT_EQ(markdown.tool_calls.size(), 1u);
  EXPECT_EQ(markdown.tool_calls[0].arguments["format"], "md");
}

TEST_F(QueryPlannerTest, IntentsForUnregisteredToolsAreSkipped) {
  HeuristicPlanner bare(std::make_shared<ToolRegistry>(), std::make_shared<KeywordExtractor>());
  EXPECT_TRUE(bare.plan("show stats and categories", {}, "c1").tool_calls.empty());
}

TEST_F(QueryPlannerTest, MalformedInlineCallThrows) {
  EXPECT_THROW(planner_->plan("@echo(text) hi", {}, ""), InvalidArgumentError);
}

}  // namespace localmind_core
