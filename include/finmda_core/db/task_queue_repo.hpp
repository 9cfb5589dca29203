#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "finmda_core/db/database_manager.hpp"
#include "finmda_core/db/task.hpp"
#include "finmda_core/errors.hpp"

namespace finmda_core {

class TaskQueueRepoError : public FinmdaError {
 public:
  explicit TaskQueueRepoError(const std::string &message) : FinmdaError(message) {}
};

/**
 * Durable queue of indexing work stored next to the index.
 *
 * A task is only claimable when no other task for the same document is
 * PROCESSING and no earlier task for it is still PENDING, so each document's
 * operations run one at a time in enqueue order while different documents run
 * in parallel.
 */
class TaskQueueRepo {
 public:
  explicit TaskQueueRepo(DatabaseManager &db_manager);

  long long enqueue_index_document(const std::string &document_id,
                                   const std::string &text,
                                   const Metadata &metadata = {},
                                   int priority = 10);
  long long enqueue_delete_document(const std::string &document_id, int priority = 5);

  std::optional<TaskRecord> fetch_and_claim_next_task();

  void update_task_status(long long task_id, TaskStatus new_status);
  void mark_task_as_failed(long long task_id, const std::string &error_message);
  std::optional<TaskRecord> get_task(long long task_id);
  std::vector<TaskRecord> get_tasks_by_status(TaskStatus status);
  size_t count_unfinished();
  void clear_completed_tasks(int older_than_days = 7);

  // PROCESSING tasks left behind by a crashed run go back to PENDING.
  size_t requeue_interrupted_tasks();

  void upsert_task_progress(long long task_id, float percent, const std::string &message);
  std::optional<TaskProgress> get_task_progress(long long task_id);

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  long long create_task(const std::string &task_type,
                        const std::string &document_id,
                        const std::string &payload,
                        const Metadata &metadata,
                        int priority);

  DatabaseManager &db_manager_;
};

}  // namespace finmda_core
