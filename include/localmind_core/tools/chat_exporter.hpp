#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "localmind_core/db/conversation_repo.hpp"
#include "localmind_core/rag/cancellation.hpp"

namespace localmind_core {

struct ExportResult {
  std::string filename;
  std::filesystem::path path;
  size_t turn_count = 0;
};

// Writes a conversation to <export_dir>/chat_export_<id8>_<timestamp>.<fmt>.
class ChatExporter {
 public:
  ChatExporter(std::shared_ptr<ConversationRepo> conversations, std::filesystem::path export_dir);

  // format is one of json, txt, md. Throws InvalidArgumentError for an
  // unknown format or conversation, StorageError if the file cannot be
  // written, and CancelledError if cancellation is set before the write.
  ExportResult export_conversation(const std::string& conversation_id,
                                   const std::string& format,
                                   const CancellationToken& cancellation = CancellationToken()) const;

  // Rendered file body without touching the disk.
  std::string render(const Conversation& conversation,
                     const std::vector<ConversationTurn>& turns,
                     const std::string& format) const;

  static bool is_supported_format(const std::string& format);

 private:
  std::shared_ptr<ConversationRepo> conversations_;
  std::filesystem::path export_dir_;
};

}  // namespace localmind_core
