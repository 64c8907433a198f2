#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "localmind_core/async/service_provider.hpp"
#include "localmind_core/async/worker_pool.hpp"
#include "../../common/utilities_test.hpp"

namespace localmind_tests {

using namespace localmind_core;
using namespace localmind_core::async;

class WorkerPoolTest : public KnowledgeBaseTestBase {
 protected:
  void SetUp() override {
    KnowledgeBaseTestBase::SetUp();
    services_ = std::make_shared<ServiceProvider>(task_queue_repo_, pipeline_);
  }

  void TearDown() override {
    services_.reset();
    KnowledgeBaseTestBase::TearDown();
  }

  std::shared_ptr<ServiceProvider> services_;
};

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0, services_); }, std::invalid_argument);
}

TEST_F(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1, services_);
    pool.stop();
    EXPECT_FALSE(pool.is_running());
  });
}

TEST_F(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  EXPECT_NO_THROW({
    WorkerPool pool(2, services_, std::chrono::milliseconds(10));
    EXPECT_EQ(pool.size(), 2u);
    pool.start();
    pool.start();
    EXPECT_TRUE(pool.is_running());
    pool.stop();
  });
}

TEST_F(WorkerPoolTest, WorkersShareTheQueueWithoutDuplicates) {
  constexpr int kTasks = 6;
  for (int i = 0; i < kTasks; ++i) {
    auto path = TestUtilities::write_file(work_dir_ / "pool" / ("doc" + std::to_string(i) + ".txt"),
                                          "Document number " + std::to_string(i) + " for the pool.");
    task_queue_repo_->enqueue_ingest(path.string());
  }

  {
    WorkerPool pool(3, services_, std::chrono::milliseconds(10));
    pool.start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size() < kTasks &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    pool.stop();
  }

  EXPECT_EQ(task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED).size(), static_cast<size_t>(kTasks));
  EXPECT_TRUE(task_queue_repo_->get_tasks_by_status(TaskStatus::FAILED).empty());
  EXPECT_EQ(knowledge_base_->stats().document_count, static_cast<size_t>(kTasks));
  EXPECT_NO_THROW(knowledge_base_->verify_consistency());
}

}  // namespace localmind_tests
