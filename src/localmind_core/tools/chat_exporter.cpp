#include "localmind_core/tools/chat_exporter.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/errors.hpp"

namespace localmind_core {

ChatExporter::ChatExporter(std::shared_ptr<ConversationRepo> conversations, std::filesystem::path export_dir)
    : conversations_(std::move(conversations)), export_dir_(std::move(export_dir)) {}

bool ChatExporter::is_supported_format(const std::string& format) {
  return format == "json" || format == "txt" || format == "md";
}

std::string ChatExporter::render(const Conversation& conversation,
                                 const std::vector<ConversationTurn>& turns,
                                 const std::string& format) const {
  const std::string category = conversation.category.empty() ? "N/A" : conversation.category;

  if (format == "json") {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& turn : turns) {
      nlohmann::json calls = nlohmann::json::array();
      for (const auto& call : turn.tool_calls) {
        calls.push_back(to_json(call));
      }
      messages.push_back({{"turn_id", turn.id},
                          {"timestamp", time_point_to_string(turn.created_at)},
                          {"user", turn.user_query},
                          {"assistant", turn.response},
                          {"category", turn.category},
                          {"keywords", turn.keywords},
                          {"retrieved_chunk_ids", turn.retrieved_chunk_ids},
                          {"tool_calls", calls}});
    }
    nlohmann::json doc = {{"conversation",
                           {{"id", conversation.id},
                            {"title", conversation.title},
                            {"category", conversation.category},
                            {"created_at", time_point_to_string(conversation.created_at)},
                            {"updated_at", time_point_to_string(conversation.updated_at)}}},
                          {"turns", messages}};
    return doc.dump(2);
  }

  std::stringstream ss;
  if (format == "txt") {
    ss << "Conversation: " << conversation.title << "\n";
    ss << "Category: " << category << "\n";
    ss << "Created: " << time_point_to_string(conversation.created_at) << "\n";
    ss << std::string(50, '=') << "\n\n";
    for (const auto& turn : turns) {
      const std::string stamp = time_point_to_string(turn.created_at);
      ss << "[User] " << stamp << "\n" << turn.user_query << "\n\n";
      ss << "[Assistant] " << stamp << "\n" << turn.response << "\n\n";
    }
    return ss.str();
  }

  if (format == "md") {
    ss << "# " << conversation.title << "\n\n";
    ss << "- **Category**: " << category << "\n";
    ss << "- **Created**: " << time_point_to_string(conversation.created_at) << "\n";
    ss << "- **Turns**: " << turns.size() << "\n\n";
    ss << "---\n\n";
    for (const auto& turn : turns) {
      const std::string stamp = time_point_to_string(turn.created_at);
      ss << "## User\n*" << stamp << "*\n\n" << turn.user_query << "\n\n";
      ss << "## LocalMind\n*" << stamp << "*\n\n" << turn.response << "\n\n";
    }
    return ss.str();
  }

  throw InvalidArgumentError("Unsupported export format: " + format + " (expected json, txt or md)");
}

ExportResult ChatExporter::export_conversation(const std::string& conversation_id,
                                               const std::string& format,
                                               const CancellationToken& cancellation) const {
  if (!is_supported_format(format)) {
    throw InvalidArgumentError("Unsupported export format: " + format + " (expected json, txt or md)");
  }
  auto conversation = conversations_->get_conversation(conversation_id);
  if (!conversation) {
    throw InvalidArgumentError("Conversation not found: " + conversation_id);
  }
  const auto turns = conversations_->get_turns(conversation_id);

  ExportResult result;
  result.filename = "chat_export_" + conversation_id.substr(0, 8) + "_" +
                    compact_timestamp(std::chrono::system_clock::now()) + "." + format;
  result.path = export_dir_ / result.filename;
  result.turn_count = turns.size();

  cancellation.throw_if_cancelled("chat export");
  std::error_code ec;
  std::filesystem::create_directories(export_dir_, ec);
  if (ec) {
    throw StorageError("Failed to create export directory " + export_dir_.string() + ": " + ec.message());
  }

  std::ofstream out(result.path, std::ios::binary);
  if (!out.is_open()) {
    throw StorageError("Failed to open export file: " + result.path.string());
  }
  out << render(*conversation, turns, format);
  if (!out) {
    throw StorageError("Failed to write export file: " + result.path.string());
  }
  return result;
}

}  // namespace localmind_core
