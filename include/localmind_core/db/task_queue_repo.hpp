#pragma once

#include <optional>
#include <string>
#include <vector>

#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/db/models/task_dto.hpp"
#include "localmind_core/db/models/task_progress_dto.hpp"

namespace localmind_core {

class TaskQueueRepoError : public std::exception {
 public:
  explicit TaskQueueRepoError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class TaskQueueRepo {
 public:
  static constexpr const char* kIngestDocument = "INGEST_DOCUMENT";
  static constexpr const char* kRemoveDocument = "REMOVE_DOCUMENT";

  explicit TaskQueueRepo(DatabaseManager& db_manager);

  long long create_task(const std::string& task_type, const std::string& target_path, int priority = 10);
  long long enqueue_ingest(const std::string& file_path, int priority = 10);
  long long enqueue_remove(const std::string& document_id, int priority = 5);

  // Claims the oldest highest-priority pending task inside one IMMEDIATE
  // transaction, so two workers never claim the same row.
  std::optional<TaskDTO> fetch_and_claim_next_task();

  void update_task_status(long long task_id, TaskStatus new_status);
  void mark_task_as_failed(long long task_id, const std::string& error_message);

  std::optional<TaskDTO> get_task(long long task_id);
  std::vector<TaskDTO> get_tasks_by_status(TaskStatus status);
  std::vector<TaskDTO> list_tasks(size_t limit = 100);

  // Deletes COMPLETED and FAILED tasks last updated at least older_than_days
  // ago. Returns the number of rows removed.
  int clear_finished_tasks(int older_than_days = 7);

  void upsert_task_progress(long long task_id, float percent, const std::string& message);
  std::optional<TaskProgressDTO> get_task_progress(long long task_id);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace localmind_core
