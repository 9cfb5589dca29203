#pragma once

#include <memory>
#include <string>

#include "finmda_core/db/task.hpp"
#include "finmda_core/types/progress.hpp"

namespace finmda_core {
class ServiceProvider;
}

namespace finmda_core {

/**
 * One claimed unit of queue work, bound to a single document. execute() runs
 * on a worker thread and throws on failure; the worker records the outcome.
 */
class ITask {
 public:
  explicit ITask(const TaskRecord& record) : id_(record.id), document_id_(record.document_id) {}
  virtual ~ITask() = default;

  virtual void execute(ServiceProvider& services, const ProgressUpdater& on_progress) = 0;
  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  const std::string& get_document_id() const {
    return document_id_;
  }

 protected:
  long long id_;
  std::string document_id_;
};

using ITaskPtr = std::unique_ptr<ITask>;

}  // namespace finmda_core
