#include "finmda_core/async/delete_document_task.hpp"

#include "finmda_core/async/service_provider.hpp"
#include "finmda_core/services/document_indexer.hpp"

namespace finmda_core {

void DeleteDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Removing chunks...");
  size_t removed = services.get_document_indexer().on_document_deleted(document_id_);
  on_progress(1.0f, "Removed " + std::to_string(removed) + " chunks.");
}

}  // namespace finmda_core
