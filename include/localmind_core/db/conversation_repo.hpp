#pragma once

#include <optional>
#include <string>
#include <vector>

#include "localmind_core/db/conversation_store.hpp"
#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/errors.hpp"

namespace localmind_core {

class ConversationRepoError : public StorageError {
 public:
  explicit ConversationRepoError(const std::string& message) : StorageError(message) {}
};

/**
 * @class ConversationRepo
 * @brief SQLite-backed ConversationStore plus the conversation, category and
 * statistics queries used by the tools and the API.
 */
class ConversationRepo : public ConversationStore {
 public:
  static constexpr size_t kTitleChars = 50;

  explicit ConversationRepo(DatabaseManager& db_manager);

  long long append_turn(const ConversationTurn& turn) override;
  std::vector<ConversationTurn> get_recent(const std::string& conversation_id, size_t n) override;

  // Returns the new conversation id (32 hex characters).
  std::string create_conversation(const std::string& title, const std::string& category = "");
  std::optional<Conversation> get_conversation(const std::string& conversation_id);
  std::vector<Conversation> list_conversations(size_t limit = 50);
  bool delete_conversation(const std::string& conversation_id);

  // All turns, oldest first.
  std::vector<ConversationTurn> get_turns(const std::string& conversation_id);

  // Case-insensitive substring match over queries and responses, newest
  // first. An empty category means no filter.
  std::vector<ConversationTurn> search_turns(const std::string& query,
                                             size_t limit,
                                             const std::string& category = "");

  // Throws InvalidArgumentError if the name is empty or already taken.
  void create_category(const CategoryInfo& category);
  std::vector<CategoryInfo> list_user_categories();

  ConversationStatistics statistics();

 private:
  DatabaseManager& db_manager_;
};

}  // namespace localmind_core
