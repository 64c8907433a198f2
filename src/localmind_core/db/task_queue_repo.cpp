#include "localmind_core/db/task_queue_repo.hpp"

#include <sqlite_modern_cpp.h>

#include "localmind_core/db/pooled_connection.hpp"
#include "localmind_core/db/sql_time.hpp"
#include "localmind_core/db/sqlite_error_utils.hpp"
#include "localmind_core/db/transaction.hpp"

namespace localmind_core {

namespace {

const char* kTaskColumns =
    "SELECT id, task_type, status, priority, target_path, error_message, created_at, updated_at "
    "FROM task_queue";

TaskDTO make_task(long long id,
                  std::string task_type,
                  const std::string& status,
                  int priority,
                  std::optional<std::string> target_path,
                  std::optional<std::string> error_message,
                  const std::string& created_at,
                  const std::string& updated_at) {
  TaskDTO task;
  task.id = id;
  task.task_type = std::move(task_type);
  task.status = task_status_from_string(status);
  task.priority = priority;
  task.target_path = std::move(target_path);
  task.error_message = std::move(error_message);
  task.created_at = string_to_time_point(created_at);
  task.updated_at = string_to_time_point(updated_at);
  return task;
}

}  // namespace

TaskQueueRepo::TaskQueueRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long TaskQueueRepo::create_task(const std::string& task_type, const std::string& target_path, int priority) {
  try {
    PooledConnection conn(db_manager_);
    const std::string now = time_point_to_string(std::chrono::system_clock::now());
    *conn << "INSERT INTO task_queue (task_type, status, priority, target_path, created_at, updated_at) "
             "VALUES (?,?,?,?,?,?)"
          << task_type << to_string(TaskStatus::PENDING) << priority << target_path << now << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("create_task", e));
  }
}

long long TaskQueueRepo::enqueue_ingest(const std::string& file_path, int priority) {
  return create_task(kIngestDocument, file_path, priority);
}

long long TaskQueueRepo::enqueue_remove(const std::string& document_id, int priority) {
  return create_task(kRemoveDocument, document_id, priority);
}

std::optional<TaskDTO> TaskQueueRepo::fetch_and_claim_next_task() {
  std::optional<TaskDTO> result;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << std::string(kTaskColumns) + " WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC LIMIT 1"
          << to_string(TaskStatus::PENDING) >>
        [&](long long id, std::string task_type, std::string status, int priority,
            std::optional<std::string> target_path, std::optional<std::string> error_message,
            std::string created_at, std::string updated_at) {
          result = make_task(id, std::move(task_type), status, priority, std::move(target_path),
                             std::move(error_message), created_at, updated_at);
        };

    if (result) {
      auto now = std::chrono::system_clock::now();
      *conn << "UPDATE task_queue SET status = ?, updated_at = ? WHERE id = ?"
            << to_string(TaskStatus::PROCESSING) << time_point_to_string(now) << result->id;
      result->status = TaskStatus::PROCESSING;
      result->updated_at = now;
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("fetch_and_claim_next_task", e));
  }
}

void TaskQueueRepo::update_task_status(long long task_id, TaskStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE task_queue SET status = ?, updated_at = ? WHERE id = ?" << to_string(new_status)
          << time_point_to_string(std::chrono::system_clock::now()) << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("update_task_status", e));
  }
}

void TaskQueueRepo::mark_task_as_failed(long long task_id, const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE task_queue SET status = ?, error_message = ?, updated_at = ? WHERE id = ?"
          << to_string(TaskStatus::FAILED) << error_message
          << time_point_to_string(std::chrono::system_clock::now()) << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("mark_task_as_failed", e));
  }
}

std::optional<TaskDTO> TaskQueueRepo::get_task(long long task_id) {
  std::optional<TaskDTO> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) + " WHERE id = ?" << task_id >>
        [&](long long id, std::string task_type, std::string status, int priority,
            std::optional<std::string> target_path, std::optional<std::string> error_message,
            std::string created_at, std::string updated_at) {
          result = make_task(id, std::move(task_type), status, priority, std::move(target_path),
                             std::move(error_message), created_at, updated_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("get_task", e));
  }
}

std::vector<TaskDTO> TaskQueueRepo::get_tasks_by_status(TaskStatus status) {
  std::vector<TaskDTO> tasks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) + " WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC"
          << to_string(status) >>
        [&](long long id, std::string task_type, std::string status_db, int priority,
            std::optional<std::string> target_path, std::optional<std::string> error_message,
            std::string created_at, std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), status_db, priority, std::move(target_path),
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("get_tasks_by_status", e));
  }
}

std::vector<TaskDTO> TaskQueueRepo::list_tasks(size_t limit) {
  std::vector<TaskDTO> tasks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) + " ORDER BY id DESC LIMIT ?" << static_cast<long long>(limit) >>
        [&](long long id, std::string task_type, std::string status, int priority,
            std::optional<std::string> target_path, std::optional<std::string> error_message,
            std::string created_at, std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), status, priority, std::move(target_path),
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("list_tasks", e));
  }
}

int TaskQueueRepo::clear_finished_tasks(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM task_queue WHERE status IN (?, ?) AND updated_at <= ?"
          << to_string(TaskStatus::COMPLETED) << to_string(TaskStatus::FAILED) << time_point_to_string(cutoff);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("clear_finished_tasks", e));
  }
}

void TaskQueueRepo::upsert_task_progress(long long task_id, float percent, const std::string& message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO task_progress (task_id, progress_percent, status_message, updated_at) "
             "VALUES (?,?,?,?) ON CONFLICT(task_id) DO UPDATE SET "
             "progress_percent = excluded.progress_percent, status_message = excluded.status_message, "
             "updated_at = excluded.updated_at"
          << task_id << percent << message << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("upsert_task_progress", e));
  }
}

std::optional<TaskProgressDTO> TaskQueueRepo::get_task_progress(long long task_id) {
  std::optional<TaskProgressDTO> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT task_id, progress_percent, status_message, updated_at FROM task_progress WHERE task_id = ?"
          << task_id >>
        [&](long long id, double percent, std::string message, std::string updated_at) {
          result = TaskProgressDTO{id, static_cast<float>(percent), std::move(message), std::move(updated_at)};
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskQueueRepoError(format_db_error("get_task_progress", e));
  }
}

}  // namespace localmind_core
