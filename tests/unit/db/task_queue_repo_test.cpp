#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

#include "utilities_test.hpp"

namespace finmda_tests {

using namespace finmda_core;

class TaskQueueRepoTest : public DatabaseTestBase {};

TEST_F(TaskQueueRepoTest, EnqueueIndexDocument_StoresPayloadAndMetadata) {
  const std::string text = "Revenue grew 12% in the fourth quarter. " + std::string(2000, 'x');
  long long task_id =
      task_queue_repo_->enqueue_index_document("10k-2024", text, {{"company", "ACME"}});

  EXPECT_GT(task_id, 0);
  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->task_type, task_types::INDEX_DOCUMENT);
  EXPECT_EQ(task->document_id, "10k-2024");
  EXPECT_EQ(task->payload, text);
  EXPECT_EQ(task->metadata.at("company"), "ACME");
  EXPECT_EQ(task->status, TaskStatus::PENDING);
  EXPECT_EQ(task->priority, 10);
  EXPECT_FALSE(task->error_message.has_value());
}

TEST_F(TaskQueueRepoTest, EnqueueDeleteDocument_DefaultsToHigherPriority) {
  long long task_id = task_queue_repo_->enqueue_delete_document("old-doc");

  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->task_type, task_types::DELETE_DOCUMENT);
  EXPECT_EQ(task->priority, 5);
  EXPECT_TRUE(task->payload.empty());
  EXPECT_TRUE(task->metadata.empty());
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_OrdersByPriority) {
  task_queue_repo_->enqueue_index_document("a", "text a", {}, 10);
  long long urgent = task_queue_repo_->enqueue_index_document("b", "text b", {}, 1);
  task_queue_repo_->enqueue_index_document("c", "text c", {}, 10);

  auto claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, urgent);
  EXPECT_EQ(claimed->status, TaskStatus::PROCESSING);

  auto processing = task_queue_repo_->get_tasks_by_status(TaskStatus::PROCESSING);
  ASSERT_EQ(processing.size(), 1u);
  EXPECT_EQ(processing[0].id, urgent);
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_EmptyQueue) {
  EXPECT_FALSE(task_queue_repo_->fetch_and_claim_next_task().has_value());
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_OneTaskPerDocumentAtATime) {
  long long first = task_queue_repo_->enqueue_index_document("doc", "v1");
  long long second = task_queue_repo_->enqueue_index_document("doc", "v2");
  long long other = task_queue_repo_->enqueue_index_document("other", "text");

  auto claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, first);

  // "doc" is busy, so its second task waits while "other" proceeds.
  claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, other);
  EXPECT_FALSE(task_queue_repo_->fetch_and_claim_next_task().has_value());

  task_queue_repo_->update_task_status(first, TaskStatus::COMPLETED);
  claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, second);
  EXPECT_EQ(claimed->payload, "v2");
}

TEST_F(TaskQueueRepoTest, FetchAndClaimNextTask_PriorityDoesNotReorderOneDocument) {
  long long index_task = task_queue_repo_->enqueue_index_document("doc", "text");
  task_queue_repo_->enqueue_delete_document("doc");

  auto claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, index_task);
}

TEST_F(TaskQueueRepoTest, MarkTaskAsFailed_RecordsMessage) {
  long long task_id = task_queue_repo_->enqueue_index_document("doc", "text");
  task_queue_repo_->fetch_and_claim_next_task();
  task_queue_repo_->mark_task_as_failed(task_id, "embedding service unavailable");

  auto task = task_queue_repo_->get_task(task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_EQ(task->error_message.value_or(""), "embedding service unavailable");

  // A failed task no longer blocks its document.
  long long retry = task_queue_repo_->enqueue_index_document("doc", "text");
  auto claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, retry);
}

TEST_F(TaskQueueRepoTest, CountUnfinished) {
  EXPECT_EQ(task_queue_repo_->count_unfinished(), 0u);
  long long a = task_queue_repo_->enqueue_index_document("a", "text");
  task_queue_repo_->enqueue_index_document("b", "text");
  task_queue_repo_->fetch_and_claim_next_task();
  EXPECT_EQ(task_queue_repo_->count_unfinished(), 2u);

  task_queue_repo_->update_task_status(a, TaskStatus::COMPLETED);
  EXPECT_EQ(task_queue_repo_->count_unfinished(), 1u);
}

TEST_F(TaskQueueRepoTest, RequeueInterruptedTasks_SurvivesRestart) {
  long long task_id = task_queue_repo_->enqueue_index_document("doc", "text");
  ASSERT_TRUE(task_queue_repo_->fetch_and_claim_next_task().has_value());

  reopen_database();

  EXPECT_EQ(task_queue_repo_->requeue_interrupted_tasks(), 1u);
  EXPECT_EQ(task_queue_repo_->requeue_interrupted_tasks(), 0u);
  auto claimed = task_queue_repo_->fetch_and_claim_next_task();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id, task_id);
  EXPECT_EQ(claimed->payload, "text");
}

TEST_F(TaskQueueRepoTest, ClearCompletedTasks_KeepsUnfinishedWork) {
  long long done = task_queue_repo_->enqueue_index_document("a", "text");
  long long failed = task_queue_repo_->enqueue_index_document("b", "text");
  long long pending = task_queue_repo_->enqueue_index_document("c", "text");
  task_queue_repo_->update_task_status(done, TaskStatus::COMPLETED);
  task_queue_repo_->mark_task_as_failed(failed, "boom");

  task_queue_repo_->clear_completed_tasks(7);
  EXPECT_TRUE(task_queue_repo_->get_task(done).has_value());

  task_queue_repo_->clear_completed_tasks(0);
  EXPECT_FALSE(task_queue_repo_->get_task(done).has_value());
  EXPECT_FALSE(task_queue_repo_->get_task(failed).has_value());
  EXPECT_TRUE(task_queue_repo_->get_task(pending).has_value());
}

TEST_F(TaskQueueRepoTest, TaskProgress_Upserts) {
  long long task_id = task_queue_repo_->enqueue_index_document("doc", "text");
  EXPECT_FALSE(task_queue_repo_->get_task_progress(task_id).has_value());

  task_queue_repo_->upsert_task_progress(task_id, 0.25f, "Chunking");
  task_queue_repo_->upsert_task_progress(task_id, 0.75f, "Embedding");

  auto progress = task_queue_repo_->get_task_progress(task_id);
  ASSERT_TRUE(progress.has_value());
  EXPECT_EQ(progress->task_id, task_id);
  EXPECT_FLOAT_EQ(progress->progress_percent, 0.75f);
  EXPECT_EQ(progress->status_message, "Embedding");
}

TEST_F(TaskQueueRepoTest, TimePointStringsRoundTripToTheSecond) {
  auto now = std::chrono::system_clock::now();
  auto parsed = TaskQueueRepo::string_to_time_point(TaskQueueRepo::time_point_to_string(now));
  auto diff = std::chrono::duration_cast<std::chrono::seconds>(now - parsed);
  EXPECT_GE(diff.count(), 0);
  EXPECT_LT(diff.count(), 1);
}

}  // namespace finmda_tests
