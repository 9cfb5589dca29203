#pragma once

#include <memory>
#include <stdexcept>

namespace finmda_core {
class TaskQueueRepo;
class DocumentIndexer;
}

namespace finmda_core {

// What a running task may touch. Workers share one instance.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<TaskQueueRepo> task_repo,
                  std::shared_ptr<DocumentIndexer> document_indexer)
      : task_repo_(std::move(task_repo)), document_indexer_(std::move(document_indexer)) {
    if (!task_repo_ || !document_indexer_) {
      throw std::invalid_argument("ServiceProvider needs a task queue and a document indexer.");
    }
  }

  TaskQueueRepo& get_task_queue_repo() const {
    return *task_repo_;
  }
  DocumentIndexer& get_document_indexer() const {
    return *document_indexer_;
  }

 private:
  std::shared_ptr<TaskQueueRepo> task_repo_;
  std::shared_ptr<DocumentIndexer> document_indexer_;
};

}  // namespace finmda_core
