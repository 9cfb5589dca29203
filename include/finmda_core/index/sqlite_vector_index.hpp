#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "finmda_core/db/database_manager.hpp"
#include "finmda_core/index/faiss_vector_index.hpp"
#include "finmda_core/index/vector_index.hpp"

namespace finmda_core {

/**
 * @brief Persistent VectorIndex: SQLite rows are the source of truth and a
 * FaissVectorIndex serves queries.
 *
 * Every write runs in one SQLite transaction and is mirrored into the cache
 * only after commit, so a failed batch leaves both untouched. The cache is
 * rebuilt from the database on construction and by rebuild().
 */
class SqliteVectorIndex : public VectorIndex {
 public:
  // Throws InvalidConfig when the database was created for another dimension.
  SqliteVectorIndex(DatabaseManager &db_manager, size_t dimension);
  ~SqliteVectorIndex() override = default;

  SqliteVectorIndex(const SqliteVectorIndex &) = delete;
  SqliteVectorIndex &operator=(const SqliteVectorIndex &) = delete;

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

  // Reloads every row and swaps the in-memory cache in one step.
  // Throws IndexUnavailable when a stored row cannot be read.
  void rebuild();

  // Ordered document ids with at least one stored chunk.
  std::vector<std::string> list_documents();

 private:
  void check_stored_dimension();
  size_t write_locked(const std::vector<std::string> &remove_ids,
                      const std::vector<IndexItem> &items);

  DatabaseManager &db_manager_;
  size_t dimension_;
  FaissVectorIndex cache_;
  std::mutex write_mutex_;
};

}  // namespace finmda_core
