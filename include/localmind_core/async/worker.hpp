#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace localmind_core {
class ServiceProvider;
}

namespace localmind_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that drains the task queue.
 *
 * The worker polls the TaskQueueRepo for pending tasks, runs each one through
 * the IndexingPipeline and records the outcome and progress on the task row.
 * It sleeps for poll_interval when the queue is empty.
 *
 * Managed by a WorkerPool; non-copyable and non-movable so that ownership of
 * the thread stays clear.
 */
class Worker {
 public:
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::seconds(5));

  /**
   * @brief Stops the loop and joins the thread. Blocks until the current task
   * (if any) finishes.
   */
  ~Worker();

  // Throws std::runtime_error if the worker is already running.
  void start();

  // Signals the loop to exit after its current task. Does not block.
  void stop();

  // Runs at most one task on the calling thread. Returns false if the queue
  // was empty.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};
}  // namespace async
}  // namespace localmind_core
