#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "localmind_core/types/conversation.hpp"

namespace localmind_core {

// Append-only record of question/answer turns.
class ConversationStore {
 public:
  virtual ~ConversationStore() = default;

  // Writes the whole turn in one transaction and returns its id. The
  // conversation is created on its first turn.
  virtual long long append_turn(const ConversationTurn& turn) = 0;

  // Up to n most recent turns, returned oldest to newest.
  virtual std::vector<ConversationTurn> get_recent(const std::string& conversation_id, size_t n) = 0;
};

}  // namespace localmind_core
