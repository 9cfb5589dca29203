#include "finmda_core/services/document_indexer.hpp"

#include <algorithm>
#include <iostream>

#include "finmda_core/errors.hpp"

namespace finmda_core {

namespace {
const char *const kContentHashKey = "content_hash";
const char *const kChunkingKey = "chunking";
const char *const kMetadataHashKey = "metadata_hash";

// Metadata is an ordered map, so equal maps serialize identically.
std::string metadata_signature(const Metadata &metadata) {
  std::string serialized;
  for (const auto &[key, value] : metadata) {
    serialized += std::to_string(key.size()) + ":" + key + "=" + std::to_string(value.size()) +
                  ":" + value + ";";
  }
  return TextChunker::compute_content_hash(serialized);
}
}  // namespace

DocumentIndexer::DocumentIndexer(TextChunker chunker,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<VectorIndex> index)
    : chunker_(std::move(chunker)), embedder_(std::move(embedder)), index_(std::move(index)) {
  if (!embedder_ || !index_) {
    throw InvalidConfig("DocumentIndexer requires an embedding provider and a vector index");
  }
}

std::string DocumentIndexer::chunking_signature() const {
  return std::to_string(chunker_.options().chunk_size) + "/" +
         std::to_string(chunker_.options().overlap);
}

bool DocumentIndexer::is_current(const std::string &document_id,
                                 const std::string &content_hash,
                                 const Metadata &metadata) const {
  const size_t stored = index_->count(MetadataFilter::by_document(document_id));
  if (stored == 0) {
    return false;
  }
  MetadataFilter same_build = MetadataFilter::by_document(document_id);
  same_build.where(kContentHashKey, content_hash)
      .where(kChunkingKey, chunking_signature())
      .where(kMetadataHashKey, metadata_signature(metadata));
  return index_->count(same_build) == stored;
}

IndexingResult DocumentIndexer::on_document_added(const std::string &document_id,
                                                  const std::string &text,
                                                  const Metadata &metadata,
                                                  const ProgressUpdater &on_progress) {
  auto progress = [&](float p, const std::string &message) {
    if (on_progress) {
      on_progress(p, message);
    }
  };

  IndexingResult result;
  result.document_id = document_id;
  result.content_hash = TextChunker::compute_content_hash(text);

  if (is_current(document_id, result.content_hash, metadata)) {
    result.skipped = true;
    result.chunk_count = index_->count(MetadataFilter::by_document(document_id));
    progress(1.0f, "Document unchanged, skipped.");
    return result;
  }

  Metadata chunk_metadata = metadata;
  chunk_metadata[kContentHashKey] = result.content_hash;
  chunk_metadata[kChunkingKey] = chunking_signature();
  chunk_metadata[kMetadataHashKey] = metadata_signature(metadata);
  std::vector<Chunk> chunks = chunker_.chunk(document_id, text, chunk_metadata);
  progress(0.1f, "Split into " + std::to_string(chunks.size()) + " chunks.");

  // Embed everything before touching the index so a failure leaves the old set intact.
  std::vector<IndexItem> items;
  items.reserve(chunks.size());
  for (size_t start = 0; start < chunks.size(); start += kEmbedBatchSize) {
    const size_t end = std::min(start + kEmbedBatchSize, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    std::vector<std::vector<float>> vectors = embedder_->embed(texts);
    if (vectors.size() != texts.size()) {
      throw EmbeddingUnavailable("Embedding provider returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " chunks");
    }
    for (size_t i = start; i < end; ++i) {
      items.push_back({chunks[i].id, std::move(vectors[i - start]), chunks[i].text,
                       chunks[i].metadata});
    }

    float p = 0.1f + 0.8f * (static_cast<float>(end) / static_cast<float>(chunks.size()));
    progress(p, "Embedded " + std::to_string(end) + " of " + std::to_string(chunks.size()) +
                    " chunks.");
  }

  result.removed = index_->replace(MetadataFilter::by_document(document_id), items);
  result.chunk_count = items.size();
  progress(1.0f, "Indexing complete.");
  std::cout << "[DocumentIndexer] Indexed document " << document_id << ": " << result.chunk_count
            << " chunks (" << result.removed << " replaced)" << std::endl;
  return result;
}

size_t DocumentIndexer::on_document_deleted(const std::string &document_id) {
  const size_t removed = index_->remove(MetadataFilter::by_document(document_id));
  std::cout << "[DocumentIndexer] Removed document " << document_id << ": " << removed
            << " chunks" << std::endl;
  return removed;
}

}  // namespace finmda_core
