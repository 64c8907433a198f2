#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "localmind_core/async/ITask.hpp"

namespace localmind_core {
class RemoveDocumentTask : public ITask {
 public:
  RemoveDocumentTask(long long id,
                     TaskStatus status,
                     std::chrono::system_clock::time_point created_at,
                     std::chrono::system_clock::time_point updated_at,
                     std::optional<std::string> error_message,
                     std::string document_id);

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override { return "REMOVE_DOCUMENT"; }

  const std::string& get_document_id() const { return document_id_; }

 private:
  std::string document_id_;
};
}  // namespace localmind_core
