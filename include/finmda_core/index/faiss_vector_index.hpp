#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "finmda_core/index/vector_index.hpp"

namespace finmda_core {

/**
 * @brief In-memory VectorIndex over an exact faiss inner-product index.
 *
 * Vectors are L2-normalised on insert, so the inner product faiss returns is
 * the cosine similarity. String ids map onto faiss labels; re-upserting an id
 * drops its old label before adding the new vector.
 */
class FaissVectorIndex : public VectorIndex {
 public:
  explicit FaissVectorIndex(size_t dimension);
  ~FaissVectorIndex() override;

  FaissVectorIndex(const FaissVectorIndex &) = delete;
  FaissVectorIndex &operator=(const FaissVectorIndex &) = delete;

  void upsert(const std::vector<IndexItem> &items) override;
  size_t remove(const MetadataFilter &filter) override;
  size_t replace(const MetadataFilter &filter, const std::vector<IndexItem> &items) override;
  std::vector<IndexMatch> query(const std::vector<float> &vector,
                                size_t top_k,
                                const std::optional<MetadataFilter> &filter = std::nullopt) override;
  size_t count(const std::optional<MetadataFilter> &filter = std::nullopt) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::vector<std::string> ids_matching(const MetadataFilter &filter) const;

  void clear();

  // Swaps the whole contents for items; queries see either the old set or the new one.
  void reset(const std::vector<IndexItem> &items);

 private:
  struct Record {
    faiss::idx_t label;
    std::string text;
    Metadata metadata;
  };

  void validate_vector_dimension(const std::vector<float> &vector) const;
  void upsert_locked(const std::vector<IndexItem> &items);
  size_t remove_locked(const std::vector<std::string> &ids);
  std::vector<std::string> ids_matching_locked(const MetadataFilter &filter) const;

  size_t dimension_;
  std::unique_ptr<faiss::IndexIDMap2> faiss_index_;
  std::unordered_map<std::string, Record> records_;
  std::unordered_map<faiss::idx_t, std::string> label_to_id_;
  faiss::idx_t next_label_ = 0;
  mutable std::shared_mutex mutex_;
};

}  // namespace finmda_core
