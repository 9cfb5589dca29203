#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "finmda_core/types/chunk.hpp"

namespace finmda_core {

struct IndexItem {
  std::string id;
  std::vector<float> vector;
  std::string text;
  Metadata metadata;
};

struct IndexMatch {
  std::string id;
  std::string text;
  Metadata metadata;
  float distance = 0.0f;
};

// Conjunction of key == value terms. An empty filter matches everything.
struct MetadataFilter {
  std::map<std::string, std::string> equals;

  static MetadataFilter by_document(const std::string &document_id) {
    MetadataFilter filter;
    filter.equals["document_id"] = document_id;
    return filter;
  }

  MetadataFilter &where(const std::string &key, const std::string &value) {
    equals[key] = value;
    return *this;
  }

  bool empty() const {
    return equals.empty();
  }

  bool matches(const Metadata &metadata) const {
    for (const auto &[key, value] : equals) {
      auto it = metadata.find(key);
      if (it == metadata.end() || it->second != value) {
        return false;
      }
    }
    return true;
  }
};

/**
 * @brief Storage and k-nearest-neighbour lookup of chunk embeddings.
 *
 * Distances are cosine distances (1 - cosine similarity) and results come back
 * in ascending distance order, ties broken by id. Every mutating call is
 * applied atomically: concurrent readers see either the whole batch or none
 * of it.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Re-upserting an id replaces the stored entry.
  virtual void upsert(const std::vector<IndexItem> &items) = 0;

  // Returns the number of removed entries.
  virtual size_t remove(const MetadataFilter &filter) = 0;

  // Removes every entry matching the filter and upserts items in one step.
  virtual size_t replace(const MetadataFilter &filter, const std::vector<IndexItem> &items) = 0;

  virtual std::vector<IndexMatch> query(const std::vector<float> &vector,
                                        size_t top_k,
                                        const std::optional<MetadataFilter> &filter = std::nullopt) = 0;

  virtual size_t count(const std::optional<MetadataFilter> &filter = std::nullopt) = 0;

  virtual size_t dimension() const = 0;
};

}  // namespace finmda_core
