#include "localmind_core/async/ingest_document_task.hpp"

#include <iostream>

#include "localmind_core/async/service_provider.hpp"
#include "localmind_core/ingest/indexing_pipeline.hpp"

namespace localmind_core {

IngestDocumentTask::IngestDocumentTask(long long id,
                                       TaskStatus status,
                                       std::chrono::system_clock::time_point created_at,
                                       std::chrono::system_clock::time_point updated_at,
                                       std::optional<std::string> error_message,
                                       std::string file_path)
    : ITask(id, status, created_at, updated_at, std::move(error_message)), file_path_(std::move(file_path)) {}

void IngestDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Starting ingestion of " + file_path_);

  IngestResult result = services.get_indexing_pipeline().ingest_file(file_path_, on_progress);

  if (result.unchanged) {
    on_progress(100.0f, "Content unchanged; nothing to do.");
  } else if (!result.snapshot_warning.empty()) {
    on_progress(100.0f, "Indexed " + std::to_string(result.chunks_added) +
                            " chunks; snapshot not saved: " + result.snapshot_warning);
  } else {
    on_progress(100.0f, "Indexed " + std::to_string(result.chunks_added) + " chunks (replaced " +
                            std::to_string(result.chunks_removed) + ").");
  }
  std::cout << "[IngestDocumentTask] " << result.document_id << ": +" << result.chunks_added << " -"
            << result.chunks_removed << (result.unchanged ? " (unchanged)" : "") << std::endl;
}

}  // namespace localmind_core
