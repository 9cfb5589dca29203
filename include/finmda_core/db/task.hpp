#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "finmda_core/types/chunk.hpp"

namespace finmda_core {

enum class TaskStatus { PENDING, PROCESSING, COMPLETED, FAILED };

inline std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING: return "PENDING";
    case TaskStatus::PROCESSING: return "PROCESSING";
    case TaskStatus::COMPLETED: return "COMPLETED";
    case TaskStatus::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline TaskStatus task_status_from_string(const std::string &str) {
  if (str == "PENDING") return TaskStatus::PENDING;
  if (str == "PROCESSING") return TaskStatus::PROCESSING;
  if (str == "COMPLETED") return TaskStatus::COMPLETED;
  if (str == "FAILED") return TaskStatus::FAILED;
  throw std::invalid_argument("Invalid TaskStatus string: " + str);
}

namespace task_types {
inline constexpr const char *INDEX_DOCUMENT = "INDEX_DOCUMENT";
inline constexpr const char *DELETE_DOCUMENT = "DELETE_DOCUMENT";
}  // namespace task_types

struct TaskRecord {
  long long id = 0;
  std::string task_type;
  std::string document_id;
  std::string payload;  // document text for INDEX_DOCUMENT
  Metadata metadata;
  TaskStatus status = TaskStatus::PENDING;
  int priority = 10;
  std::optional<std::string> error_message;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct TaskProgress {
  long long task_id = 0;
  float progress_percent = 0.0f;
  std::string status_message;
  std::string updated_at;
};

}  // namespace finmda_core
