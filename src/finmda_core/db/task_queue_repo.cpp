#include "finmda_core/db/task_queue_repo.hpp"

#include <sqlite_modern_cpp.h>

#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

#include "finmda_core/db/pooled_connection.hpp"
#include "finmda_core/db/sqlite_error_utils.hpp"
#include "finmda_core/db/transaction.hpp"
#include "finmda_core/services/compression_service.hpp"

namespace finmda_core {

namespace {

const char *const kTaskColumns =
    "id, task_type, document_id, payload, metadata, status, priority, error_message, "
    "created_at, updated_at";

// Columns in kTaskColumns order.
struct TaskRow {
  TaskRecord operator()(long long id,
                        std::string task_type,
                        std::string document_id,
                        std::optional<std::vector<char>> payload,
                        std::string metadata,
                        std::string status,
                        int priority,
                        std::optional<std::string> error_message,
                        std::string created_at,
                        std::string updated_at) const {
    TaskRecord task;
    task.id = id;
    task.task_type = std::move(task_type);
    task.document_id = std::move(document_id);
    if (payload) {
      task.payload = CompressionService::decompress(*payload);
    }
    task.metadata = nlohmann::json::parse(metadata).get<Metadata>();
    task.status = task_status_from_string(status);
    task.priority = priority;
    task.error_message = std::move(error_message);
    task.created_at = TaskQueueRepo::string_to_time_point(created_at);
    task.updated_at = TaskQueueRepo::string_to_time_point(updated_at);
    return task;
  }
};

}  // namespace

TaskQueueRepo::TaskQueueRepo(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::string TaskQueueRepo::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point TaskQueueRepo::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

long long TaskQueueRepo::create_task(const std::string &task_type,
                                     const std::string &document_id,
                                     const std::string &payload,
                                     const Metadata &metadata,
                                     int priority) {
  try {
    PooledConnection conn(db_manager_);
    std::string now = time_point_to_string(std::chrono::system_clock::now());
    nlohmann::json metadata_json = metadata;
    std::optional<std::vector<char>> compressed;
    if (!payload.empty()) {
      compressed = CompressionService::compress(payload);
    }
    *conn << "INSERT INTO task_queue (task_type, document_id, payload, metadata, priority, "
             "created_at, updated_at) VALUES (?,?,?,?,?,?,?)"
          << task_type << document_id << compressed << metadata_json.dump() << priority << now
          << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("create_task", e));
  }
}

long long TaskQueueRepo::enqueue_index_document(const std::string &document_id,
                                                const std::string &text,
                                                const Metadata &metadata,
                                                int priority) {
  return create_task(task_types::INDEX_DOCUMENT, document_id, text, metadata, priority);
}

long long TaskQueueRepo::enqueue_delete_document(const std::string &document_id, int priority) {
  return create_task(task_types::DELETE_DOCUMENT, document_id, "", {}, priority);
}

std::optional<TaskRecord> TaskQueueRepo::fetch_and_claim_next_task() {
  std::optional<TaskRecord> result;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM task_queue t WHERE t.status = 'PENDING'"
                 " AND NOT EXISTS (SELECT 1 FROM task_queue busy WHERE busy.document_id = "
                 "t.document_id AND busy.status = 'PROCESSING')"
                 " AND NOT EXISTS (SELECT 1 FROM task_queue earlier WHERE earlier.document_id = "
                 "t.document_id AND earlier.status = 'PENDING' AND earlier.id < t.id)"
                 " ORDER BY t.priority ASC, t.id ASC LIMIT 1" >>
        [&](long long id, std::string task_type, std::string document_id,
            std::optional<std::vector<char>> payload, std::string metadata, std::string status,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = TaskRow()(id, std::move(task_type), std::move(document_id), std::move(payload),
                             std::move(metadata), std::move(status), priority,
                             std::move(error_message), std::move(created_at),
                             std::move(updated_at));
        };

    if (result) {
      auto now = std::chrono::system_clock::now();
      std::string processing_status = to_string(TaskStatus::PROCESSING);
      *conn << "UPDATE task_queue SET status = ?, updated_at = ? WHERE id = ?"
            << processing_status << time_point_to_string(now) << result->id;
      result->status = TaskStatus::PROCESSING;
      result->updated_at = now;
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("fetch_and_claim_next_task", e));
  }
}

void TaskQueueRepo::update_task_status(long long task_id, TaskStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    std::string updated_at_str = time_point_to_string(std::chrono::system_clock::now());
    std::string status_str = to_string(new_status);
    *conn << "UPDATE task_queue SET status = ?, updated_at = ? WHERE id = ?" << status_str
          << updated_at_str << task_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("update_task_status", e));
  }
}

void TaskQueueRepo::mark_task_as_failed(long long task_id, const std::string &error_message) {
  try {
    PooledConnection conn(db_manager_);
    std::string updated_at_str = time_point_to_string(std::chrono::system_clock::now());
    std::string failed_status = to_string(TaskStatus::FAILED);
    *conn << "UPDATE task_queue SET status = ?, error_message = ?, updated_at = ? WHERE id = ?"
          << failed_status << error_message << updated_at_str << task_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("mark_task_as_failed", e));
  }
}

std::optional<TaskRecord> TaskQueueRepo::get_task(long long task_id) {
  std::optional<TaskRecord> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kTaskColumns + " FROM task_queue WHERE id = ?" << task_id >>
        [&](long long id, std::string task_type, std::string document_id,
            std::optional<std::vector<char>> payload, std::string metadata, std::string status,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = TaskRow()(id, std::move(task_type), std::move(document_id), std::move(payload),
                             std::move(metadata), std::move(status), priority,
                             std::move(error_message), std::move(created_at),
                             std::move(updated_at));
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("get_task", e));
  }
}

std::vector<TaskRecord> TaskQueueRepo::get_tasks_by_status(TaskStatus status) {
  std::vector<TaskRecord> tasks;
  try {
    PooledConnection conn(db_manager_);
    std::string status_str = to_string(status);
    *conn << std::string("SELECT ") + kTaskColumns +
                 " FROM task_queue WHERE status = ? ORDER BY priority ASC, id ASC"
          << status_str >>
        [&](long long id, std::string task_type, std::string document_id,
            std::optional<std::vector<char>> payload, std::string metadata, std::string status_db,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(TaskRow()(id, std::move(task_type), std::move(document_id),
                                    std::move(payload), std::move(metadata), std::move(status_db),
                                    priority, std::move(error_message), std::move(created_at),
                                    std::move(updated_at)));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("get_tasks_by_status", e));
  }
}

size_t TaskQueueRepo::count_unfinished() {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM task_queue WHERE status IN ('PENDING', 'PROCESSING')" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("count_unfinished", e));
  }
}

void TaskQueueRepo::clear_completed_tasks(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    std::string cutoff_str = time_point_to_string(cutoff_time);
    std::string completed_status = to_string(TaskStatus::COMPLETED);
    std::string failed_status = to_string(TaskStatus::FAILED);
    *conn << "DELETE FROM task_queue WHERE status IN (?, ?) AND updated_at <= ?"
          << completed_status << failed_status << cutoff_str;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("clear_completed_tasks", e));
  }
}

size_t TaskQueueRepo::requeue_interrupted_tasks() {
  try {
    PooledConnection conn(db_manager_);
    std::string updated_at_str = time_point_to_string(std::chrono::system_clock::now());
    *conn << "UPDATE task_queue SET status = 'PENDING', updated_at = ? WHERE status = "
             "'PROCESSING'"
          << updated_at_str;
    return static_cast<size_t>(conn->rows_modified());
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("requeue_interrupted_tasks", e));
  }
}

void TaskQueueRepo::upsert_task_progress(long long task_id,
                                         float percent,
                                         const std::string &message) {
  try {
    PooledConnection conn(db_manager_);
    std::string updated_at_str = time_point_to_string(std::chrono::system_clock::now());
    *conn << "INSERT INTO task_progress (task_id, progress_percent, status_message, updated_at) "
             "VALUES (?, ?, ?, ?) ON CONFLICT(task_id) DO UPDATE SET "
             "progress_percent = excluded.progress_percent, "
             "status_message = excluded.status_message, updated_at = excluded.updated_at"
          << task_id << percent << message << updated_at_str;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("upsert_task_progress", e));
  }
}

std::optional<TaskProgress> TaskQueueRepo::get_task_progress(long long task_id) {
  std::optional<TaskProgress> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT task_id, progress_percent, status_message, updated_at FROM task_progress "
             "WHERE task_id = ?"
          << task_id >>
        [&](long long id, double percent, std::optional<std::string> message,
            std::string updated_at) {
          TaskProgress progress;
          progress.task_id = id;
          progress.progress_percent = static_cast<float>(percent);
          progress.status_message = message.value_or("");
          progress.updated_at = updated_at;
          result = std::move(progress);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw TaskQueueRepoError(format_db_error("get_task_progress", e));
  }
}

}  // namespace finmda_core
