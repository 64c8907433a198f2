#include "localmind_core/db/conversation_repo.hpp"

#include <openssl/rand.h>
#include <sqlite_modern_cpp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "localmind_core/db/pooled_connection.hpp"
#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/db/sqlite_error_utils.hpp"
#include "localmind_core/db/transaction.hpp"
#include "localmind_core/text/text_utils.hpp"

namespace localmind_core {

namespace {

const char* kTurnColumns =
    "SELECT id, conversation_id, user_query, response, COALESCE(category, ''), keywords, "
    "retrieved_chunk_ids, tool_calls, created_at FROM turns";

std::string random_id() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw ConversationRepoError("Failed to generate a conversation id");
  }
  std::stringstream ss;
  for (unsigned char b : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

std::string escape_like(const std::string& text) {
  std::string out;
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

std::string tool_calls_to_json(const std::vector<ToolCallRecord>& calls) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& call : calls) {
    array.push_back(to_json(call));
  }
  return array.dump();
}

// Row callback shared by every turn query.
struct TurnCollector {
  std::vector<ConversationTurn>& out;

  void operator()(long long id, std::string conversation_id, std::string user_query, std::string response,
                  std::string category, std::string keywords, std::string retrieved, std::string tool_calls,
                  std::string created_at) const {
    ConversationTurn turn;
    turn.id = id;
    turn.conversation_id = std::move(conversation_id);
    turn.user_query = std::move(user_query);
    turn.response = std::move(response);
    turn.category = std::move(category);
    turn.created_at = string_to_time_point(created_at);

    auto keyword_json = nlohmann::json::parse(keywords, nullptr, false);
    if (keyword_json.is_array()) {
      for (const auto& keyword : keyword_json) {
        if (keyword.is_string()) {
          turn.keywords.push_back(keyword.get<std::string>());
        }
      }
    }
    auto retrieved_json = nlohmann::json::parse(retrieved, nullptr, false);
    if (retrieved_json.is_array()) {
      for (const auto& chunk_id : retrieved_json) {
        if (chunk_id.is_number_integer()) {
          turn.retrieved_chunk_ids.push_back(chunk_id.get<ChunkId>());
        }
      }
    }
    auto calls_json = nlohmann::json::parse(tool_calls, nullptr, false);
    if (calls_json.is_array()) {
      for (const auto& call : calls_json) {
        turn.tool_calls.push_back(tool_call_record_from_json(call));
      }
    }
    out.push_back(std::move(turn));
  }
};

}  // namespace

ConversationRepo::ConversationRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long ConversationRepo::append_turn(const ConversationTurn& turn) {
  if (turn.conversation_id.empty()) {
    throw InvalidArgumentError("Turn has no conversation id");
  }

  const auto created = turn.created_at.time_since_epoch().count() == 0 ? std::chrono::system_clock::now()
                                                                       : turn.created_at;
  const std::string created_at = time_point_to_string(created);

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);

    int existing = 0;
    *conn << "SELECT COUNT(*) FROM conversations WHERE id = ?" << turn.conversation_id >> existing;
    if (existing == 0) {
      std::string title = text::truncate_chars(text::sanitize_utf8(turn.user_query), kTitleChars);
      if (text::is_blank(title)) {
        title = "New conversation";
      }
      *conn << "INSERT INTO conversations (id, title, category, created_at, updated_at) "
               "VALUES (?, ?, ?, ?, ?)"
            << turn.conversation_id << title << turn.category << created_at << created_at;
    } else {
      *conn << "UPDATE conversations SET updated_at = ?, "
               "category = COALESCE(NULLIF(category, ''), ?) WHERE id = ?"
            << created_at << turn.category << turn.conversation_id;
    }

    *conn << "INSERT INTO turns (conversation_id, user_query, response, category, keywords, "
             "retrieved_chunk_ids, tool_calls, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
          << turn.conversation_id << turn.user_query << turn.response << turn.category
          << nlohmann::json(turn.keywords).dump() << nlohmann::json(turn.retrieved_chunk_ids).dump()
          << tool_calls_to_json(turn.tool_calls) << created_at;
    const long long id = conn->last_insert_rowid();

    tx.commit();
    return id;
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("append_turn", e));
  }
}

std::vector<ConversationTurn> ConversationRepo::get_recent(const std::string& conversation_id, size_t n) {
  std::vector<ConversationTurn> turns;
  if (n == 0) {
    return turns;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTurnColumns) + " WHERE conversation_id = ? ORDER BY id DESC LIMIT ?"
          << conversation_id << static_cast<long long>(n) >>
        TurnCollector{turns};
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("get_recent", e));
  }
  std::reverse(turns.begin(), turns.end());
  return turns;
}

std::string ConversationRepo::create_conversation(const std::string& title, const std::string& category) {
  const std::string id = random_id();
  const std::string now = time_point_to_string(std::chrono::system_clock::now());
  const std::string clean_title = text::is_blank(title) ? "New conversation" : title;
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO conversations (id, title, category, created_at, updated_at) "
             "VALUES (?, ?, ?, ?, ?)"
          << id << clean_title << category << now << now;
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("create_conversation", e));
  }
  return id;
}

std::optional<Conversation> ConversationRepo::get_conversation(const std::string& conversation_id) {
  std::optional<Conversation> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.id, c.title, COALESCE(c.category, ''), "
             "(SELECT COUNT(*) FROM turns t WHERE t.conversation_id = c.id), c.created_at, c.updated_at "
             "FROM conversations c WHERE c.id = ?"
          << conversation_id >>
        [&](std::string id, std::string title, std::string category, int turn_count,
            std::string created_at, std::string updated_at) {
          result = Conversation{std::move(id),
                                std::move(title),
                                std::move(category),
                                turn_count,
                                string_to_time_point(created_at),
                                string_to_time_point(updated_at)};
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("get_conversation", e));
  }
  return result;
}

std::vector<Conversation> ConversationRepo::list_conversations(size_t limit) {
  std::vector<Conversation> conversations;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.id, c.title, COALESCE(c.category, ''), "
             "(SELECT COUNT(*) FROM turns t WHERE t.conversation_id = c.id), c.created_at, c.updated_at "
             "FROM conversations c ORDER BY c.updated_at DESC, c.id LIMIT ?"
          << static_cast<long long>(limit) >>
        [&](std::string id, std::string title, std::string category, int turn_count,
            std::string created_at, std::string updated_at) {
          conversations.push_back(Conversation{std::move(id),
                                               std::move(title),
                                               std::move(category),
                                               turn_count,
                                               string_to_time_point(created_at),
                                               string_to_time_point(updated_at)});
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("list_conversations", e));
  }
  return conversations;
}

bool ConversationRepo::delete_conversation(const std::string& conversation_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM conversations WHERE id = ?" << conversation_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("delete_conversation", e));
  }
}

std::vector<ConversationTurn> ConversationRepo::get_turns(const std::string& conversation_id) {
  std::vector<ConversationTurn> turns;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTurnColumns) + " WHERE conversation_id = ? ORDER BY id" << conversation_id >>
        TurnCollector{turns};
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("get_turns", e));
  }
  return turns;
}

std::vector<ConversationTurn> ConversationRepo::search_turns(const std::string& query,
                                                             size_t limit,
                                                             const std::string& category) {
  std::vector<ConversationTurn> turns;
  const std::string pattern = "%" + escape_like(query) + "%";
  try {
    PooledConnection conn(db_manager_);
    if (category.empty()) {
      *conn << std::string(kTurnColumns) +
                   " WHERE (user_query LIKE ? ESCAPE '\\' OR response LIKE ? ESCAPE '\\') "
                   "ORDER BY id DESC LIMIT ?"
            << pattern << pattern << static_cast<long long>(limit) >>
          TurnCollector{turns};
    } else {
      *conn << std::string(kTurnColumns) +
                   " WHERE (user_query LIKE ? ESCAPE '\\' OR response LIKE ? ESCAPE '\\') "
                   "AND category = ? ORDER BY id DESC LIMIT ?"
            << pattern << pattern << category << static_cast<long long>(limit) >>
          TurnCollector{turns};
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("search_turns", e));
  }
  return turns;
}

void ConversationRepo::create_category(const CategoryInfo& category) {
  if (text::is_blank(category.name)) {
    throw InvalidArgumentError("Category name must not be empty");
  }
  try {
    PooledConnection conn(db_manager_);
    int existing = 0;
    *conn << "SELECT COUNT(*) FROM categories WHERE name = ?" << category.name >> existing;
    if (existing > 0) {
      throw InvalidArgumentError("Category already exists: " + category.name);
    }
    *conn << "INSERT INTO categories (name, description, color, created_at) VALUES (?, ?, ?, ?)"
          << category.name << category.description
          << (category.color.empty() ? std::string("#007bff") : category.color)
          << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("create_category", e));
  }
}

std::vector<CategoryInfo> ConversationRepo::list_user_categories() {
  std::vector<CategoryInfo> categories;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT name, description, color FROM categories ORDER BY name" >>
        [&](std::string name, std::string description, std::string color) {
          categories.push_back({std::move(name), std::move(description), std::move(color), true});
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("list_user_categories", e));
  }
  return categories;
}

ConversationStatistics ConversationRepo::statistics() {
  ConversationStatistics stats;
  try {
    PooledConnection conn(db_manager_);
    long long conversations = 0;
    long long turns = 0;
    *conn << "SELECT COUNT(*) FROM conversations" >> conversations;
    *conn << "SELECT COUNT(*) FROM turns" >> turns;
    stats.conversation_count = static_cast<size_t>(conversations);
    stats.turn_count = static_cast<size_t>(turns);
    *conn << "SELECT COALESCE(category, ''), COUNT(*) AS n FROM turns "
             "GROUP BY COALESCE(category, '') ORDER BY n DESC, 1" >>
        [&](std::string category, long long count) {
          stats.turns_per_category.emplace_back(std::move(category), static_cast<size_t>(count));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationRepoError(format_db_error("statistics", e));
  }
  return stats;
}

}  // namespace localmind_core
