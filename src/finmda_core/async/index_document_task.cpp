#include "finmda_core/async/index_document_task.hpp"

#include <iostream>

#include "finmda_core/async/service_provider.hpp"
#include "finmda_core/services/document_indexer.hpp"

namespace finmda_core {

void IndexDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Starting indexing...");
  IndexingResult result =
      services.get_document_indexer().on_document_added(document_id_, text_, metadata_, on_progress);
  if (result.skipped) {
    std::cout << "[IndexDocumentTask] " << document_id_ << " unchanged, nothing to do." << std::endl;
  }
}

}  // namespace finmda_core
