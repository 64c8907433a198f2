#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "localmind_core/async/ITask.hpp"

namespace localmind_core {
class IngestDocumentTask : public ITask {
 public:
  IngestDocumentTask(long long id,
                     TaskStatus status,
                     std::chrono::system_clock::time_point created_at,
                     std::chrono::system_clock::time_point updated_at,
                     std::optional<std::string> error_message,
                     std::string file_path);

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override { return "INGEST_DOCUMENT"; }

  const std::string& get_file_path() const { return file_path_; }

 private:
  std::string file_path_;
};
}  // namespace localmind_core
