#include <gtest/gtest.h>

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "localmind_core/db/models/task_dto.hpp"

namespace localmind_core {

class TaskQueueRepoTest : public localmind_tests::DatabaseTestBase {};

TEST_F(TaskQueueRepoTest, CreateTask_BasicFunctionality) {
  long long task_id = task_queue_repo_->create_task(TaskQueueRepo::kIngestDocument, "/test/notes.md", 5);

  EXPECT_GT(task_id, 0);

  auto pending_tasks = task_queue_repo_->get_tasks_by_status(TaskStatus::PENDING);
  ASSERT_EQ(pending_tasks.size(), 1);
  EXPECT_EQ(pending_tasks[0].id, task_id);
  EXPECT_EQ(pending_tasks[0].task_type, TaskQueueRepo::kIngestDocument);
  EXPECT_EQ(pending_tasks[0].target_path, "/test/notes.md");
  EXPECT_EQ(pending_tasks[0].status, TaskStatus::PENDING);
  EXPECT_EQ(pending_tasks[0].priority, 5);
}

TEST_F(TaskQueueRepoTest, EnqueueHelpers_UseTheirDefaultPriorities) {
  long long ingest_id = task_queue_repo_->enqueue_ingest("/test/a.txt");
  long long remove_id = task_queue_repo_->enqueue_remove("/test/b.txt");

  auto ingest = task_queue_repo_->get_task(ingest_id);
  auto remove = task_queue_repo_->get_task(remove_id);
  ASSERT_TRUE(ingest.has_value());
  ASSERT_TRUE(remove.has_value());
  EXPECT_EQ(ingest->task_type, TaskQueueRepo::kIngestDocument);
  EXPECT_EQ(ingest->priority, 10);
  EXPECT_EQ(remove->task_type, TaskQueueRepo::kRemoveDocument);
  EXPECT_EQ(remove->priority, 5);
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_LowestPriorityValueFirst) {
  task_queue_repo_->create_task(TaskQueueRepo::kIngestDocument, "/test/file1.txt", 5);
  long long urgent = task_queue_repo_->create_task(TaskQueueRepo::kIngestDocument, "/test/file2.txt", 1);
  task_queue_repo_->create_task(TaskQueueRepo::kIngestDocument, "/test/file3.txt", 10);

  auto claimed_task = task_queue_repo_->fetch_and_claim_next_task();

  ASSERT_TRUE(claimed_task.has_value());
  EXPECT_EQ(claimed_task->id, urgent);
  EXPECT_EQ(claimed_task->status, TaskStatus::PROCESSING);

  auto processing_tasks = task_queue_repo_->get_tasks_by_status(TaskStatus::PROCESSING);
  ASSERT_EQ(processing_tasks.size(), 1);
  EXPECT_EQ(processing_tasks[0].id, urgent);
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_EqualPriorityIsFifo) {
  long long first = task_queue_repo_->enqueue_ingest("/test/first.txt");
  long long second = task_queue_repo_->enqueue_ingest("/test/second.txt");

  auto a = task_queue_repo_->fetch_and_claim_next_task();
  auto b = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->id, first);
  EXPECT_EQ(b->id, second);
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_NoTasksAvailable) {
  EXPECT_FALSE(task_queue_repo_->fetch_and_claim_next_task().has_value());
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_ConcurrentWorkersNeverShareATask) {
  const int kTasks = 20;
  for (int i = 0; i < kTasks; ++i) {
    task_queue_repo_->enqueue_ingest("/test/file_" + std::to_string(i) + ".txt");
  }

  std::mutex claimed_mutex;
  std::vector<long long> claimed;
  std::vector<std::thread> threads;
  for (int t = 0; t < 3; ++t) {
    threads.emplace_back([&]() {
      while (auto task = task_queue_repo_->fetch_and_claim_next_task()) {
        std::lock_guard<std::mutex> lock(claimed_mutex);
        claimed.push_back(task->id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<long long> unique(claimed.begin(), claimed.end());
  EXPECT_EQ(claimed.size(), static_cast<size_t>(kTasks));
  EXPECT_EQ(unique.size(), static_cast<size_t>(kTasks));
}

TEST_F(TaskQueueRepoTest, UpdateTaskStatus_BasicFunctionality) {
  long long task_id = task_queue_repo_->enqueue_ingest("/test/file.txt");

  task_queue_repo_->update_task_status(task_id, TaskStatus::COMPLETED);

  auto completed_tasks = task_queue_repo_->get_tasks_by_status(TaskStatus::COMPLETED);
  ASSERT_EQ(completed_tasks.size(), 1);
  EXPECT_EQ(completed_tasks[0].id, task_id);
  EXPECT_TRUE(task_queue_repo_->get_tasks_by_status(TaskStatus::PENDING).empty());
}

TEST_F(TaskQueueRepoTest, MarkTaskAsFailed_StoresErrorMessage) {
  long long task_id = task_queue_repo_->enqueue_ingest("/test/file.txt");

  task_queue_repo_->mark_task_as_failed(task_id, "Document is empty");

  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  ASSERT_TRUE(task->error_message.has_value());
  EXPECT_EQ(*task->error_message, "Document is empty");
}

TEST_F(TaskQueueRepoTest, GetTask_UnknownIdReturnsNullopt) {
  EXPECT_FALSE(task_queue_repo_->get_task(4242).has_value());
}

TEST_F(TaskQueueRepoTest, ListTasks_NewestFirstAndLimited) {
  long long a = task_queue_repo_->enqueue_ingest("/test/a.txt");
  long long b = task_queue_repo_->enqueue_ingest("/test/b.txt");
  long long c = task_queue_repo_->enqueue_ingest("/test/c.txt");
  (void)a;

  auto tasks = task_queue_repo_->list_tasks(2);
  ASSERT_EQ(tasks.size(), 2);
  EXPECT_EQ(tasks[0].id, c);
  EXPECT_EQ(tasks[1].id, b);
}

TEST_F(TaskQueueRepoTest, ClearFinishedTasks_KeepsPendingAndProcessing) {
  long long done = task_queue_repo_->enqueue_ingest("/test/done.txt");
  long long failed = task_queue_repo_->enqueue_ingest("/test/failed.txt");
  long long pending = task_queue_repo_->enqueue_ingest("/test/pending.txt");
  task_queue_repo_->update_task_status(done, TaskStatus::COMPLETED);
  task_queue_repo_->mark_task_as_failed(failed, "boom");

  // Nothing is a week old yet.
  EXPECT_EQ(task_queue_repo_->clear_finished_tasks(7), 0);

  EXPECT_EQ(task_queue_repo_->clear_finished_tasks(0), 2);
  EXPECT_FALSE(task_queue_repo_->get_task(done).has_value());
  EXPECT_FALSE(task_queue_repo_->get_task(failed).has_value());
  EXPECT_TRUE(task_queue_repo_->get_task(pending).has_value());
}

TEST_F(TaskQueueRepoTest, TaskProgress_UpsertOverwrites) {
  long long task_id = task_queue_repo_->enqueue_ingest("/test/file.txt");

  EXPECT_FALSE(task_queue_repo_->get_task_progress(task_id).has_value());

  task_queue_repo_->upsert_task_progress(task_id, 10.0f, "Chunking");
  task_queue_repo_->upsert_task_progress(task_id, 55.5f, "Embedded 2/4");

  auto progress = task_queue_repo_->get_task_progress(task_id);
  ASSERT_TRUE(progress.has_value());
  EXPECT_EQ(progress->task_id, task_id);
  EXPECT_FLOAT_EQ(progress->progress_percent, 55.5f);
  EXPECT_EQ(progress->status_message, "Embedded 2/4");
}

TEST_F(TaskQueueRepoTest, TaskProgress_RemovedWithTask) {
  long long task_id = task_queue_repo_->enqueue_ingest("/test/file.txt");
  task_queue_repo_->upsert_task_progress(task_id, 100.0f, "Done");
  task_queue_repo_->update_task_status(task_id, TaskStatus::COMPLETED);

  task_queue_repo_->clear_finished_tasks(0);

  EXPECT_FALSE(task_queue_repo_->get_task_progress(task_id).has_value());
}

TEST(TaskStatusTest, RoundTripsThroughStrings) {
  EXPECT_EQ(task_status_from_string(to_string(TaskStatus::PROCESSING)), TaskStatus::PROCESSING);
  EXPECT_THROW(task_status_from_string("DONE"), std::invalid_argument);
}

}  // namespace localmind_core
