#include "localmind_core/async/worker.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "localmind_core/async/ITask.hpp"
#include "localmind_core/async/service_provider.hpp"
#include "localmind_core/async/task_factory.hpp"
#include "localmind_core/db/models/task_dto.hpp"
#include "localmind_core/db/task_queue_repo.hpp"

namespace localmind_core {
namespace async {

namespace {
constexpr std::chrono::milliseconds kStopCheckInterval{100};
}

Worker::Worker(int worker_id, std::shared_ptr<ServiceProvider> services, std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  if (thread.joinable()) {
    thread.join();
  }
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;

  while (!should_stop.load()) {
    bool ran = false;
    try {
      ran = run_one_task();
    } catch (const TaskQueueRepoError& e) {
      // The queue itself is unreachable; back off and try again.
      std::cerr << "Worker [" << worker_id_ << "] queue error: " << e.what() << std::endl;
    }
    if (ran) {
      continue;
    }

    auto waited = std::chrono::milliseconds::zero();
    while (waited < poll_interval_ && !should_stop.load()) {
      auto step = std::min(kStopCheckInterval, poll_interval_ - waited);
      std::this_thread::sleep_for(step);
      waited += step;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  std::optional<TaskDTO> task_dto = task_repo.fetch_and_claim_next_task();
  if (!task_dto) {
    return false;
  }

  std::cout << "Worker [" << worker_id_ << "] claimed task " << task_dto->id << " (" << task_dto->task_type
            << ")" << std::endl;
  try {
    ITaskPtr task = TaskFactory::create_task(*task_dto);

    ProgressUpdater on_progress = [&](float percent, const std::string& msg) {
      task_repo.upsert_task_progress(task_dto->id, percent, msg);
    };

    task->execute(*services_, on_progress);
    task_repo.update_task_status(task_dto->id, TaskStatus::COMPLETED);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << task_dto->id << ": " << e.what()
              << std::endl;
    task_repo.mark_task_as_failed(task_dto->id, e.what());
  }
  return true;
}

}  // namespace async
}  // namespace localmind_core
