#pragma once

#include "finmda_core/async/ITask.hpp"
#include "finmda_core/db/task.hpp"

namespace finmda_core {
class TaskFactory {
 public:
  // Throws std::runtime_error for an unknown task type.
  static ITaskPtr create_task(const TaskRecord& record);
};
}  // namespace finmda_core
