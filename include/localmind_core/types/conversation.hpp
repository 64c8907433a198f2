#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "localmind_core/types/chunk.hpp"
#include "localmind_core/types/tool_call.hpp"

namespace localmind_core {

struct ConversationTurn {
  long long id = 0;
  std::string conversation_id;
  std::string user_query;
  std::string response;
  std::chrono::system_clock::time_point created_at;
  std::vector<ChunkId> retrieved_chunk_ids;
  std::vector<ToolCallRecord> tool_calls;
  std::string category;
  std::vector<std::string> keywords;
};

struct Conversation {
  std::string id;
  std::string title;
  std::string category;
  int turn_count = 0;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct CategoryInfo {
  std::string name;
  std::string description;
  std::string color;
  // False for categories that only exist in the classifier dictionary.
  bool user_defined = false;
};

struct ConversationStatistics {
  size_t conversation_count = 0;
  size_t turn_count = 0;
  std::vector<std::pair<std::string, size_t>> turns_per_category;
};

}  // namespace localmind_core
