#include "finmda_core/async/task_factory.hpp"

#include <stdexcept>

#include "finmda_core/async/delete_document_task.hpp"
#include "finmda_core/async/index_document_task.hpp"

namespace finmda_core {
ITaskPtr TaskFactory::create_task(const TaskRecord& record) {
  if (record.document_id.empty()) {
    throw std::runtime_error("Task " + std::to_string(record.id) + " has no document_id.");
  }
  if (record.task_type == task_types::INDEX_DOCUMENT) {
    return std::make_unique<IndexDocumentTask>(record);
  }
  if (record.task_type == task_types::DELETE_DOCUMENT) {
    return std::make_unique<DeleteDocumentTask>(record);
  }
  throw std::runtime_error("Unknown task type: " + record.task_type);
}
}  // namespace finmda_core
