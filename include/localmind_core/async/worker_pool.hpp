#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "localmind_core/async/worker.hpp"

namespace localmind_core::async {

/**
 * @class WorkerPool
 * @brief Owns the Worker threads that run queued ingestion tasks.
 *
 * Workers are created up front and stopped and joined when the pool is
 * destroyed.
 */
class WorkerPool {
 public:
  // Throws std::invalid_argument when num_threads is 0.
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds poll_interval = std::chrono::seconds(5));

  ~WorkerPool();

  void start();

  // Signals every worker to stop. Does not block; the workers are joined on
  // destruction.
  void stop();

  size_t size() const { return m_workers.size(); }
  bool is_running() const { return m_is_running; }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace localmind_core::async
