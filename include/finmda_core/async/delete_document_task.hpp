#pragma once

#include "finmda_core/async/ITask.hpp"

namespace finmda_core {
class DeleteDocumentTask : public ITask {
 public:
  explicit DeleteDocumentTask(const TaskRecord& record) : ITask(record) {}

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return task_types::DELETE_DOCUMENT;
  }
};
}  // namespace finmda_core
