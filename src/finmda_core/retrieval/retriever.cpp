#include "finmda_core/retrieval/retriever.hpp"

#include <utf8.h>

#include <algorithm>
#include <future>
#include <iostream>
#include <iterator>
#include <map>

#include "finmda_core/errors.hpp"

namespace finmda_core {

namespace {

std::string metadata_value(const Metadata &metadata, const std::string &key) {
  auto it = metadata.find(key);
  return it == metadata.end() ? std::string() : it->second;
}

int metadata_int(const Metadata &metadata, const std::string &key) {
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return 0;
  }
  try {
    return std::stoi(it->second);
  } catch (const std::exception &) {
    return 0;
  }
}

bool by_relevance_then_id(const RetrievalHit &a, const RetrievalHit &b) {
  if (a.relevance_score != b.relevance_score)
    return a.relevance_score > b.relevance_score;
  return a.chunk_id < b.chunk_id;
}

}  // namespace

std::string make_snippet(const std::string &text, size_t max_codepoints) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  auto it = valid.begin();
  size_t taken = 0;
  while (it != valid.end() && taken < max_codepoints) {
    utf8::next(it, valid.end());
    ++taken;
  }
  if (it == valid.end()) {
    return valid;
  }
  return std::string(valid.begin(), it) + "...";
}

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedder,
                     std::shared_ptr<VectorIndex> index,
                     RetrieverOptions options)
    : embedder_(std::move(embedder)), index_(std::move(index)), options_(std::move(options)) {
  if (!embedder_ || !index_) {
    throw InvalidConfig("Retriever requires an embedding provider and a vector index");
  }
  embed_thread_ = std::thread(&Retriever::run_embed_loop, this);
}

Retriever::~Retriever() {
  {
    std::lock_guard<std::mutex> lock(embed_mutex_);
    stopping_ = true;
  }
  embed_cv_.notify_all();
  if (embed_thread_.joinable()) {
    embed_thread_.join();
  }
}

void Retriever::run_embed_loop() {
  std::unique_lock<std::mutex> lock(embed_mutex_);
  while (true) {
    embed_cv_.wait(lock, [this] { return stopping_ || pending_embed_.has_value(); });
    if (!pending_embed_) {
      break;
    }
    EmbedTask task = std::move(*pending_embed_);
    pending_embed_.reset();

    lock.unlock();
    task();
    lock.lock();
    embed_busy_ = false;
    embed_abandoned_ = false;
    embed_cv_.notify_all();
  }
}

std::vector<std::vector<float>> Retriever::embed_with_timeout(
    const std::vector<std::string> &texts) {
  std::future<std::vector<std::vector<float>>> future;
  {
    std::unique_lock<std::mutex> lock(embed_mutex_);
    embed_cv_.wait(lock, [this] { return !embed_busy_ || embed_abandoned_; });
    if (embed_busy_) {
      throw EmbeddingUnavailable("A timed-out embedding call is still running");
    }
    EmbedTask task([this, texts]() { return embedder_->embed(texts); });
    future = task.get_future();
    pending_embed_ = std::move(task);
    embed_busy_ = true;
  }
  embed_cv_.notify_all();

  if (future.wait_for(options_.embedding_timeout) != std::future_status::ready) {
    {
      std::lock_guard<std::mutex> lock(embed_mutex_);
      if (embed_busy_) {
        embed_abandoned_ = true;
      }
    }
    embed_cv_.notify_all();
    throw EmbeddingUnavailable("Embedding call did not finish within " +
                               std::to_string(options_.embedding_timeout.count()) + " ms");
  }

  std::vector<std::vector<float>> vectors;
  try {
    vectors = future.get();
  } catch (const EmbeddingUnavailable &) {
    throw;
  } catch (const std::exception &e) {
    throw EmbeddingUnavailable(std::string("Embedding call failed: ") + e.what());
  }

  if (vectors.size() != texts.size()) {
    throw EmbeddingUnavailable("Embedding provider returned " + std::to_string(vectors.size()) +
                               " vectors for " + std::to_string(texts.size()) + " texts");
  }
  return vectors;
}

std::vector<Retriever::RankedHit> Retriever::ranked_hits(
    const std::vector<float> &query_vector,
    const std::optional<std::string> &document_id,
    size_t top_k) {
  std::optional<MetadataFilter> filter;
  if (document_id) {
    filter = MetadataFilter::by_document(*document_id);
  }
  std::vector<IndexMatch> matches = index_->query(query_vector, top_k, filter);

  std::vector<RankedHit> ranked;
  ranked.reserve(matches.size());
  for (auto &match : matches) {
    RankedHit entry;
    entry.hit.chunk_id = match.id;
    entry.hit.document_id = metadata_value(match.metadata, "document_id");
    entry.hit.chunk_index = metadata_int(match.metadata, "chunk_index");
    entry.hit.text = std::move(match.text);
    entry.hit.relevance_score = std::clamp(1.0f - match.distance, 0.0f, 1.0f);
    entry.metadata = std::move(match.metadata);
    ranked.push_back(std::move(entry));
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedHit &a, const RankedHit &b) {
    return by_relevance_then_id(a.hit, b.hit);
  });
  for (size_t i = 0; i < ranked.size(); ++i) {
    ranked[i].hit.rank = static_cast<int>(i) + 1;
  }
  return ranked;
}

EvidenceBundle Retriever::build_bundle(const std::string &query,
                                       const std::vector<RankedHit> &ranked) const {
  EvidenceBundle bundle;
  bundle.query = query;
  bundle.total_results = ranked.size();

  std::string context;
  for (size_t i = 0; i < ranked.size(); ++i) {
    const RetrievalHit &hit = ranked[i].hit;

    Citation citation;
    citation.index = static_cast<int>(i) + 1;
    citation.document_id = hit.document_id;
    citation.chunk_id = hit.chunk_id;
    citation.chunk_index = hit.chunk_index;
    citation.company = metadata_value(ranked[i].metadata, "company");
    citation.period = metadata_value(ranked[i].metadata, "period");
    citation.snippet = make_snippet(hit.text, options_.snippet_length);
    citation.relevance_score = hit.relevance_score;
    bundle.citations.push_back(std::move(citation));

    if (i > 0) {
      context += options_.context_separator;
    }
    context += "[Context " + std::to_string(i + 1) + "]: " + hit.text;
    bundle.hits.push_back(hit);
  }
  bundle.context = std::move(context);
  return bundle;
}

EvidenceBundle Retriever::retrieve(const std::string &query,
                                   const std::optional<std::string> &document_id,
                                   size_t top_k) {
  return retrieve_batch({query}, document_id, top_k).front();
}

std::vector<EvidenceBundle> Retriever::retrieve_batch(const std::vector<std::string> &queries,
                                                      const std::optional<std::string> &document_id,
                                                      size_t top_k) {
  std::vector<EvidenceBundle> bundles;
  if (queries.empty()) {
    return bundles;
  }

  std::vector<std::vector<float>> query_vectors;
  try {
    query_vectors = embed_with_timeout(queries);
  } catch (const EmbeddingUnavailable &e) {
    if (!options_.best_effort) {
      throw;
    }
    std::cerr << "[Retriever] Embedding unavailable, returning empty evidence: " << e.what()
              << std::endl;
    for (const auto &query : queries) {
      EvidenceBundle empty;
      empty.query = query;
      bundles.push_back(std::move(empty));
    }
    return bundles;
  }

  bundles.reserve(queries.size());
  for (size_t i = 0; i < queries.size(); ++i) {
    bundles.push_back(build_bundle(queries[i], ranked_hits(query_vectors[i], document_id, top_k)));
  }
  return bundles;
}

std::vector<SimilarDocument> Retriever::search_similar_documents(const std::string &query,
                                                                 size_t top_k) {
  std::vector<std::vector<float>> query_vectors;
  try {
    query_vectors = embed_with_timeout({query});
  } catch (const EmbeddingUnavailable &e) {
    if (!options_.best_effort) {
      throw;
    }
    std::cerr << "[Retriever] Embedding unavailable, no similar documents: " << e.what()
              << std::endl;
    return {};
  }

  std::map<std::string, SimilarDocument> groups;
  for (const auto &entry : ranked_hits(query_vectors.front(), std::nullopt, top_k)) {
    const RetrievalHit &hit = entry.hit;
    SimilarDocument &group = groups[hit.document_id];
    group.document_id = hit.document_id;
    group.max_relevance = std::max(group.max_relevance, hit.relevance_score);
    group.chunks.push_back({hit.chunk_id, hit.chunk_index, hit.text, hit.relevance_score});
    group.total_chunks = group.chunks.size();
  }

  std::vector<SimilarDocument> documents;
  documents.reserve(groups.size());
  for (auto &[document_id, group] : groups) {
    documents.push_back(std::move(group));
  }
  std::stable_sort(documents.begin(), documents.end(),
                   [](const SimilarDocument &a, const SimilarDocument &b) {
                     return a.max_relevance > b.max_relevance;
                   });
  return documents;
}

}  // namespace finmda_core
