#include "localmind_core/async/remove_document_task.hpp"

#include "localmind_core/async/service_provider.hpp"
#include "localmind_core/ingest/indexing_pipeline.hpp"

namespace localmind_core {

RemoveDocumentTask::RemoveDocumentTask(long long id,
                                       TaskStatus status,
                                       std::chrono::system_clock::time_point created_at,
                                       std::chrono::system_clock::time_point updated_at,
                                       std::optional<std::string> error_message,
                                       std::string document_id)
    : ITask(id, status, created_at, updated_at, std::move(error_message)), document_id_(std::move(document_id)) {}

void RemoveDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Removing " + document_id_);
  size_t removed = services.get_indexing_pipeline().remove_document(document_id_);
  on_progress(100.0f, "Removed " + std::to_string(removed) + " chunks.");
}

}  // namespace localmind_core
