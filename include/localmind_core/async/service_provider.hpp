#pragma once

#include <memory>

namespace localmind_core {
class TaskQueueRepo;
class IndexingPipeline;
}

namespace localmind_core {

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<TaskQueueRepo> repo, std::shared_ptr<IndexingPipeline> pipeline)
      : task_repo_(std::move(repo)), pipeline_(std::move(pipeline)) {}

  TaskQueueRepo& get_task_queue_repo() {
    return *task_repo_;
  }
  IndexingPipeline& get_indexing_pipeline() {
    return *pipeline_;
  }

 private:
  std::shared_ptr<TaskQueueRepo> task_repo_;
  std::shared_ptr<IndexingPipeline> pipeline_;
};

}  // namespace localmind_core
