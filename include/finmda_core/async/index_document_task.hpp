#pragma once

#include "finmda_core/async/ITask.hpp"
#include "finmda_core/types/chunk.hpp"

namespace finmda_core {
// Text and metadata travel in the task payload, so indexing never rereads the source file.
class IndexDocumentTask : public ITask {
 public:
  explicit IndexDocumentTask(const TaskRecord& record)
      : ITask(record), text_(record.payload), metadata_(record.metadata) {}

  void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* get_type() const override {
    return task_types::INDEX_DOCUMENT;
  }

  const std::string& get_text() const {
    return text_;
  }
  const Metadata& get_metadata() const {
    return metadata_;
  }

 private:
  std::string text_;
  Metadata metadata_;
};
}  // namespace finmda_core
