#pragma once

#include <memory>
#include <string>

#include "finmda_core/chunking/text_chunker.hpp"
#include "finmda_core/embedding/embedding_provider.hpp"
#include "finmda_core/index/vector_index.hpp"
#include "finmda_core/types/progress.hpp"

namespace finmda_core {

struct IndexingResult {
  std::string document_id;
  std::string content_hash;
  size_t chunk_count = 0;
  size_t removed = 0;
  bool skipped = false;  // content, chunking and caller metadata unchanged since the last run
};

/**
 * @brief Document lifecycle hooks that keep the vector index in step with the
 * document store.
 *
 * A document's chunk set is always swapped in with a single
 * VectorIndex::replace, so retrieval never sees it half indexed. Each chunk
 * records the content hash, chunking parameters and a hash of the caller's
 * metadata it was built from; calling on_document_added again with the same
 * text, parameters and metadata is a no-op.
 */
class DocumentIndexer {
 public:
  static constexpr size_t kEmbedBatchSize = 64;

  DocumentIndexer(TextChunker chunker,
                  std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<VectorIndex> index);

  // Throws EmbeddingUnavailable with the previous chunk set left in place.
  IndexingResult on_document_added(const std::string &document_id,
                                   const std::string &text,
                                   const Metadata &metadata = {},
                                   const ProgressUpdater &on_progress = nullptr);

  // Returns once the document's chunks are gone from the index.
  size_t on_document_deleted(const std::string &document_id);

  bool is_current(const std::string &document_id,
                  const std::string &content_hash,
                  const Metadata &metadata = {}) const;

  const TextChunker &chunker() const {
    return chunker_;
  }

 private:
  std::string chunking_signature() const;

  TextChunker chunker_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndex> index_;
};

}  // namespace finmda_core
