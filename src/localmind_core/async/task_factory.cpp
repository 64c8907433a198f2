#include "localmind_core/async/task_factory.hpp"

#include <stdexcept>

#include "localmind_core/async/ingest_document_task.hpp"
#include "localmind_core/async/remove_document_task.hpp"
#include "localmind_core/db/models/task_dto.hpp"
#include "localmind_core/db/task_queue_repo.hpp"

namespace localmind_core {
ITaskPtr TaskFactory::create_task(const TaskDTO& record) {
  if (record.task_type == TaskQueueRepo::kIngestDocument) {
    if (!record.target_path) {
      throw std::runtime_error("INGEST_DOCUMENT task is missing required target_path.");
    }
    return std::make_unique<IngestDocumentTask>(record.id, record.status, record.created_at,
                                                record.updated_at, record.error_message,
                                                *record.target_path);
  }
  if (record.task_type == TaskQueueRepo::kRemoveDocument) {
    if (!record.target_path) {
      throw std::runtime_error("REMOVE_DOCUMENT task is missing the document id.");
    }
    return std::make_unique<RemoveDocumentTask>(record.id, record.status, record.created_at,
                                                record.updated_at, record.error_message,
                                                *record.target_path);
  }

  throw std::runtime_error("Unknown task type: " + record.task_type);
}
}  // namespace localmind_core
