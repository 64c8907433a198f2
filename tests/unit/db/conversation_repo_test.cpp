#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"

namespace localmind_core {

class ConversationRepoTest : public localmind_tests::DatabaseTestBase {
 protected:
  long long append(const std::string& conversation_id,
                   const std::string& query,
                   const std::string& response,
                   const std::string& category = "") {
    return conversation_repo_->append_turn(
        localmind_tests::TestUtilities::create_test_turn(conversation_id, query, response, category));
  }
};

TEST_F(ConversationRepoTest, AppendTurn_CreatesConversationOnFirstTurn) {
  long long id = append("conv-1", "머신러닝 모델은 어떻게 학습하나요?", "데이터로 학습합니다.", "기술");
  EXPECT_GT(id, 0);

  auto conversation = conversation_repo_->get_conversation("conv-1");
  ASSERT_TRUE(conversation.has_value());
  EXPECT_EQ(conversation->title, "머신러닝 모델은 어떻게 학습하나요?");
  EXPECT_EQ(conversation->category, "기술");
  EXPECT_EQ(conversation->turn_count, 1);
}

TEST_F(ConversationRepoTest, AppendTurn_RequiresConversationId) {
  EXPECT_THROW(append("", "q", "a"), InvalidArgumentError);
}

TEST_F(ConversationRepoTest, AppendTurn_PersistsToolCallsAndProvenance) {
  auto turn = localmind_tests::TestUtilities::create_test_turn("conv-1", "stats?", "3 documents");
  turn.retrieved_chunk_ids = {4, 8, 15};
  turn.keywords = {"stats"};
  ToolCallRecord record;
  record.name = "get_statistics";
  record.success = true;
  record.summary = "3 documents";
  record.result = {{"documents", 3}};
  turn.tool_calls.push_back(record);

  conversation_repo_->append_turn(turn);

  auto turns = conversation_repo_->get_turns("conv-1");
  ASSERT_EQ(turns.size(), 1u);
  EXPECT_EQ(turns[0].retrieved_chunk_ids, (std::vector<ChunkId>{4, 8, 15}));
  EXPECT_EQ(turns[0].keywords, (std::vector<std::string>{"stats"}));
  ASSERT_EQ(turns[0].tool_calls.size(), 1u);
  EXPECT_EQ(turns[0].tool_calls[0].name, "get_statistics");
  EXPECT_TRUE(turns[0].tool_calls[0].success);
  EXPECT_EQ(turns[0].tool_calls[0].result["documents"], 3);
}

TEST_F(ConversationRepoTest, GetRecent_ReturnsLastNOldestFirst) {
  for (int i = 1; i <= 5; ++i) {
    append("conv-1", "question " + std::to_string(i), "answer " + std::to_string(i));
  }
  append("conv-2", "other", "other");

  auto recent = conversation_repo_->get_recent("conv-1", 3);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].user_query, "question 3");
  EXPECT_EQ(recent[1].user_query, "question 4");
  EXPECT_EQ(recent[2].user_query, "question 5");

  EXPECT_TRUE(conversation_repo_->get_recent("conv-1", 0).empty());
  EXPECT_TRUE(conversation_repo_->get_recent("missing", 3).empty());
}

TEST_F(ConversationRepoTest, CreateConversation_GeneratesHexId) {
  std::string id = conversation_repo_->create_conversation("", "업무");
  EXPECT_EQ(id.size(), 32u);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);

  auto conversation = conversation_repo_->get_conversation(id);
  ASSERT_TRUE(conversation.has_value());
  EXPECT_EQ(conversation->title, "New conversation");
  EXPECT_EQ(conversation->category, "업무");
  EXPECT_EQ(conversation->turn_count, 0);
}

TEST_F(ConversationRepoTest, ListConversations_RespectsLimit) {
  conversation_repo_->create_conversation("first");
  conversation_repo_->create_conversation("second");
  conversation_repo_->create_conversation("third");

  EXPECT_EQ(conversation_repo_->list_conversations().size(), 3u);
  EXPECT_EQ(conversation_repo_->list_conversations(2).size(), 2u);
}

TEST_F(ConversationRepoTest, DeleteConversation_RemovesTurns) {
  append("conv-1", "q1", "a1");
  append("conv-1", "q2", "a2");

  EXPECT_TRUE(conversation_repo_->delete_conversation("conv-1"));
  EXPECT_FALSE(conversation_repo_->get_conversation("conv-1").has_value());
  EXPECT_TRUE(conversation_repo_->get_turns("conv-1").empty());
  EXPECT_FALSE(conversation_repo_->delete_conversation("conv-1"));
}

TEST_F(ConversationRepoTest, SearchTurns_MatchesQueryOrResponseNewestFirst) {
  append("conv-1", "How do I tune the Database?", "Add an index.", "기술");
  append("conv-1", "Weekly meeting notes", "The database migration is done.", "업무");
  append("conv-2", "Unrelated", "Nothing here");

  auto all = conversation_repo_->search_turns("database", 10);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].user_query, "Weekly meeting notes");
  EXPECT_EQ(all[1].user_query, "How do I tune the Database?");

  auto scoped = conversation_repo_->search_turns("database", 10, "기술");
  ASSERT_EQ(scoped.size(), 1u);
  EXPECT_EQ(scoped[0].category, "기술");

  EXPECT_EQ(conversation_repo_->search_turns("database", 1).size(), 1u);
}

TEST_F(ConversationRepoTest, SearchTurns_TreatsWildcardsLiterally) {
  append("conv-1", "100% sure", "yes");
  append("conv-1", "100 percent", "no");

  auto found = conversation_repo_->search_turns("100%", 10);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].user_query, "100% sure");
}

TEST_F(ConversationRepoTest, CreateCategory_RejectsDuplicatesAndBlankNames) {
  conversation_repo_->create_category({"여행", "Trips", "#ff0000", true});

  EXPECT_THROW(conversation_repo_->create_category({"여행", "", "", true}), InvalidArgumentError);
  EXPECT_THROW(conversation_repo_->create_category({"  ", "", "", true}), InvalidArgumentError);

  auto categories = conversation_repo_->list_user_categories();
  ASSERT_EQ(categories.size(), 1u);
  EXPECT_EQ(categories[0].name, "여행");
  EXPECT_EQ(categories[0].color, "#ff0000");
  EXPECT_TRUE(categories[0].user_defined);
}

TEST_F(ConversationRepoTest, Statistics_CountsTurnsPerCategory) {
  append("conv-1", "q1", "a1", "기술");
  append("conv-1", "q2", "a2", "기술");
  append("conv-2", "q3", "a3", "업무");

  auto stats = conversation_repo_->statistics();
  EXPECT_EQ(stats.conversation_count, 2u);
  EXPECT_EQ(stats.turn_count, 3u);
  ASSERT_EQ(stats.turns_per_category.size(), 2u);
  EXPECT_EQ(stats.turns_per_category[0], std::make_pair(std::string("기술"), size_t{2}));
  EXPECT_EQ(stats.turns_per_category[1], std::make_pair(std::string("업무"), size_t{1}));
}

}  // namespace localmind_core
