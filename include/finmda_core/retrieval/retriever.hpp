#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "finmda_core/embedding/embedding_provider.hpp"
#include "finmda_core/index/vector_index.hpp"
#include "finmda_core/types/evidence.hpp"

namespace finmda_core {

struct RetrieverOptions {
  std::chrono::milliseconds embedding_timeout{30000};
  // Return an empty bundle instead of throwing EmbeddingUnavailable.
  bool best_effort = false;
  size_t snippet_length = 200;  // code points
  std::string context_separator = "\n\n";
};

/**
 * @brief Turns a question into ranked, cited evidence from the vector index.
 *
 * Hits are ranked by relevance (1 - distance, clamped to [0,1]) with ties
 * broken by ascending chunk id. The embedding call is bounded by
 * RetrieverOptions::embedding_timeout; a late or failed call raises
 * EmbeddingUnavailable. Index failures always propagate.
 *
 * Embedding runs on one thread owned by the Retriever. Concurrent callers
 * take turns; while a timed-out call is still running, new calls fail fast
 * with EmbeddingUnavailable instead of queueing behind it. The destructor
 * joins that thread.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingProvider> embedder,
            std::shared_ptr<VectorIndex> index,
            RetrieverOptions options = {});
  ~Retriever();

  Retriever(const Retriever &) = delete;
  Retriever &operator=(const Retriever &) = delete;
  Retriever(Retriever &&) = delete;
  Retriever &operator=(Retriever &&) = delete;

  EvidenceBundle retrieve(const std::string &query,
                          const std::optional<std::string> &document_id = std::nullopt,
                          size_t top_k = 5);

  // One embedding call for all queries; bundles come back in query order.
  std::vector<EvidenceBundle> retrieve_batch(
      const std::vector<std::string> &queries,
      const std::optional<std::string> &document_id = std::nullopt,
      size_t top_k = 5);

  // Documents ranked by their best chunk, ties by document id.
  std::vector<SimilarDocument> search_similar_documents(const std::string &query,
                                                        size_t top_k = 10);

  const RetrieverOptions &options() const {
    return options_;
  }

 private:
  struct RankedHit {
    RetrievalHit hit;
    Metadata metadata;
  };

  using EmbedTask = std::packaged_task<std::vector<std::vector<float>>()>;

  std::vector<std::vector<float>> embed_with_timeout(const std::vector<std::string> &texts);
  void run_embed_loop();
  std::vector<RankedHit> ranked_hits(const std::vector<float> &query_vector,
                                     const std::optional<std::string> &document_id,
                                     size_t top_k);
  EvidenceBundle build_bundle(const std::string &query, const std::vector<RankedHit> &ranked) const;

  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndex> index_;
  RetrieverOptions options_;

  std::mutex embed_mutex_;
  std::condition_variable embed_cv_;
  std::optional<EmbedTask> pending_embed_;
  bool embed_busy_ = false;
  bool embed_abandoned_ = false;  // the caller stopped waiting for the running call
  bool stopping_ = false;
  std::thread embed_thread_;
};

// First max_codepoints code points of text, plus "..." when anything was cut.
std::string make_snippet(const std::string &text, size_t max_codepoints);

}  // namespace finmda_core
